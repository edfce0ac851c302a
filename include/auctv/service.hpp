/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "auctv/config.hpp"
#include "auctv/job_store.hpp"
#include "auctv/listing.hpp"
#include "auctv/types.hpp"

namespace auctv {

class Pool;
class PipelineRunner;
class SourceExtractor;

struct StandardRequest {
    std::string caseId;
    std::string source = "json";    // "json" or "mock"
    bool mock = true;
};

struct DocumentRequest {
    std::filesystem::path path;
    bool mock = true;
};

struct SubmitResult {
    bool ok = false;
    Job job;
    ErrorCode code = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

struct ListingsResult {
    bool ok = false;
    std::vector<Listing> listings;
    ErrorCode code = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Facade over the job registry, the worker pool and the pipeline. Every
// operation returns immediately; rendering happens on the pool.
class Service final {
public:
    explicit Service(Config config, std::unique_ptr<JobStore> store = nullptr);
    ~Service();

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;
    Service(Service&&) = delete;
    Service& operator=(Service&&) = delete;

    [[nodiscard]] bool start();
    // Cancels in-flight jobs and joins the workers.
    void shutdown() noexcept;
    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }

    [[nodiscard]] SubmitResult createJob(const StandardRequest& request);
    // Validates the document synchronously; no job exists on failure.
    [[nodiscard]] SubmitResult createDocumentJob(const DocumentRequest& request);

    [[nodiscard]] std::optional<Job> get(const JobId& id) const;
    [[nodiscard]] std::vector<Job> list() const;
    // Deletes the record, its video and its scratch files. In-flight jobs are
    // cancelled first; Busy when the worker does not stop in time.
    [[nodiscard]] RemoveResult remove(const JobId& id);

    // Null when the name is unsafe or the file does not exist.
    [[nodiscard]] std::unique_ptr<std::istream> openVideo(const std::string& filename) const;

    [[nodiscard]] ListingsResult listings(const std::string& source, std::size_t limit,
                                          const ListingFilter& filter = {}) const;
    [[nodiscard]] nlohmann::json listingTemplate() const { return auctv::listingTemplate(); }

    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] JobStore& store() noexcept { return *store_; }

private:
    [[nodiscard]] SubmitResult submit(JobParams params);
    // Pending -> Failed("Job cancelled"); false when a worker already owns the job.
    bool failPending(const JobId& id);
    void removeArtifacts(const Job& job) noexcept;

    Config config_;
    std::unique_ptr<JobStore> store_;
    std::unique_ptr<SourceExtractor> extractor_;
    std::unique_ptr<PipelineRunner> runner_;
    std::unique_ptr<Pool> pool_;

    std::atomic<bool> running_{false};
};

[[nodiscard]] nlohmann::json toJson(const Job& job);

// ISO-8601 UTC with milliseconds, e.g. 2025-01-31T09:30:00.123Z.
[[nodiscard]] std::string isoTimestamp(WallClock::time_point when);

}
