/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "auctv/types.hpp"

namespace auctv {

using WallClock = std::chrono::system_clock;

// Submission parameters, fixed at creation.
struct JobParams {
    JobMode mode = JobMode::Standard;
    std::string caseId;
    ListingOrigin origin = ListingOrigin::Json;
    std::filesystem::path document;
    int pageCount = 0;
    bool mock = true;
    ScriptBackend scriptBackend = ScriptBackend::Template;
    SpeechBackend speechBackend = SpeechBackend::Silent;
};

struct Job {
    JobId id;
    JobStatus status = JobStatus::Pending;
    int progress = 0;
    std::optional<std::string> currentStep;
    std::optional<std::string> outputRef;
    std::optional<std::string> error;
    ErrorCode errorCode = ErrorCode::None;
    WallClock::time_point createdAt{};
    WallClock::time_point updatedAt{};
    JobParams params;

    [[nodiscard]] bool terminal() const noexcept {
        return status == JobStatus::Completed || status == JobStatus::Failed;
    }
};

enum class RemoveResult : uint8_t { Removed, NotFound, Busy };

using JobMutation = std::function<void(Job&)>;
using JobObserver = std::function<void(const Job&)>;

// Process-wide job registry. Implementations must be safe for concurrent
// readers and writers; reads always return copies.
class JobStore {
public:
    virtual ~JobStore() = default;

    [[nodiscard]] virtual Job create(const JobParams& params) = 0;
    [[nodiscard]] virtual std::optional<Job> get(const JobId& id) const = 0;
    // Creation order.
    [[nodiscard]] virtual std::vector<Job> list() const = 0;
    // Refuses non-terminal records with Busy unless force is set.
    [[nodiscard]] virtual RemoveResult remove(const JobId& id, bool force = false) = 0;
    // Applies mutation to a live record. Returns false when the record is
    // missing or terminal. Progress never decreases and updatedAt never
    // goes backwards; identity fields are preserved.
    virtual bool update(const JobId& id, const JobMutation& mutation) = 0;
    // Called under the store lock after each applied update. The observer
    // must not call back into the store.
    virtual void setObserver(JobObserver observer) = 0;
};

class MemoryJobStore final : public JobStore {
public:
    MemoryJobStore() = default;

    MemoryJobStore(const MemoryJobStore&) = delete;
    MemoryJobStore& operator=(const MemoryJobStore&) = delete;

    [[nodiscard]] Job create(const JobParams& params) override;
    [[nodiscard]] std::optional<Job> get(const JobId& id) const override;
    [[nodiscard]] std::vector<Job> list() const override;
    [[nodiscard]] RemoveResult remove(const JobId& id, bool force = false) override;
    bool update(const JobId& id, const JobMutation& mutation) override;
    void setObserver(JobObserver observer) override;

    [[nodiscard]] std::size_t size() const;

private:
    [[nodiscard]] JobId generateId() const;

    mutable std::mutex mutex_;
    std::unordered_map<JobId, Job> jobs_;
    std::vector<JobId> order_;
    JobObserver observer_;
};

}
