/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/service.hpp"
#include "auctv/logger.hpp"
#include "auctv/pipeline.hpp"
#include "auctv/pool.hpp"
#include "auctv/source_extractor.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <thread>

namespace auctv {

namespace {

constexpr auto kRemovePollInterval = std::chrono::milliseconds(50);
constexpr auto kDocumentCheckBudget = std::chrono::seconds(30);

bool safeVideoName(const std::string& name) {
    if (name.empty() || name == ".") {
        return false;
    }
    return name.find('/') == std::string::npos &&
           name.find('\\') == std::string::npos &&
           name.find("..") == std::string::npos;
}

}

Service::Service(Config config, std::unique_ptr<JobStore> store)
    : config_(std::move(config)), store_(std::move(store)) {
    if (!store_) {
        store_ = std::make_unique<MemoryJobStore>();
    }
    auto jsonSource = std::make_shared<JsonListingSource>(config_.listingsDir(), config_.listingImagesDir());
    auto sampleSource = std::make_shared<SampleListingSource>(config_.sampleListingsFile(), config_.sampleImagesDir());
    extractor_ = std::make_unique<SourceExtractor>(config_, jsonSource, sampleSource);
    runner_ = std::make_unique<PipelineRunner>(config_, *store_, *extractor_);
    pool_ = std::make_unique<Pool>(config_.workers);
    LOG_DEBUG("Service created - output: " + config_.outputDir.string() + ", temp: " +
              config_.tempDir.string() + ", workers: " + std::to_string(config_.workers));
}

Service::~Service() {
    shutdown();
}

bool Service::start() {
    if (running_.load()) {
        LOG_WARN("Service already running");
        return false;
    }

    setThreadName("Main");
    LOG_INFO("Starting auctv service...");

    if (!config_.ensureDirectories()) {
        LOG_ERROR("Failed to create service directories");
        return false;
    }

    LOG_DEBUG("========================================");
    LOG_DEBUG("Output: " + config_.outputDir.string());
    LOG_DEBUG("Temp: " + config_.tempDir.string());
    LOG_DEBUG("Data: " + config_.dataDir.string());
    LOG_DEBUG("Workers: " + std::to_string(config_.workers));
    LOG_DEBUG("Model: " + (config_.model.configured() ? config_.model.modelPath : std::string("(none)")));
    LOG_DEBUG("Speech: " + std::string(config_.tts.configured() ? "network" : "silent only"));
    LOG_DEBUG("========================================");

    try {
        // Models load before any worker thread can ask for one
        if (!runner_->initializeModels(config_.workers)) {
            LOG_ERROR("Failed to initialize language model");
            return false;
        }

        if (!pool_->start([this](const JobId& jobId, int workerId) {
            runner_->process(jobId, workerId);
        })) {
            LOG_ERROR("Failed to start worker pool");
            return false;
        }

        running_.store(true);
        LOG_DEBUG("Service started");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start service: " + std::string(e.what()));
        return false;
    }
}

void Service::shutdown() noexcept {
    if (!running_.exchange(false)) {
        return;
    }
    LOG_INFO("Shutting down service...");
    runner_->cancelAll();
    // Queued ids are dropped by the pool, so their records are closed here
    std::size_t dropped = 0;
    try {
        for (const Job& job : store_->list()) {
            if (job.status == JobStatus::Pending && failPending(job.id)) {
                ++dropped;
            }
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to close queued jobs: " + std::string(e.what()));
    }
    if (dropped > 0) {
        LOG_INFO("Cancelled " + std::to_string(dropped) + " queued job(s)");
    }
    pool_->stop();
    LOG_INFO("Service shutdown complete");
}

SubmitResult Service::createJob(const StandardRequest& request) {
    SubmitResult result;
    std::string reason;
    if (!isValidCaseId(request.caseId, reason)) {
        result.code = ErrorCode::InputValidation;
        result.message = reason;
        return result;
    }
    JobParams params;
    params.mode = JobMode::Standard;
    params.caseId = request.caseId;
    params.mock = request.mock;
    if (!parseListingOrigin(request.source, params.origin)) {
        result.code = ErrorCode::InputValidation;
        result.message = "Unknown listing source: " + request.source;
        return result;
    }
    // The worker looks the case up again when it runs
    try {
        ListingLookup lookup = extractor_->source(params.origin).find(request.caseId);
        if (!lookup) {
            LOG_INFO("Case rejected: " + request.caseId + ": " + lookup.message);
            result.code = lookup.code;
            result.message = lookup.message;
            return result;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Listing lookup failed for " + request.caseId + ": " + e.what());
        result.code = ErrorCode::Storage;
        result.message = "Failed to read listing";
        return result;
    }
    return submit(std::move(params));
}

SubmitResult Service::createDocumentJob(const DocumentRequest& request) {
    SubmitResult result;
    DocumentCheck check = extractor_->inspectDocument(request.path, Deadline(kDocumentCheckBudget));
    if (!check) {
        LOG_INFO("Document rejected: " + request.path.string() + ": " + check.message);
        result.code = check.code;
        result.message = check.message;
        return result;
    }
    JobParams params;
    params.mode = JobMode::Document;
    std::error_code ec;
    auto absolute = std::filesystem::absolute(request.path, ec);
    params.document = ec ? request.path : absolute;
    params.pageCount = check.pages;
    params.mock = request.mock;
    return submit(std::move(params));
}

SubmitResult Service::submit(JobParams params) {
    SubmitResult result;
    if (!running_.load()) {
        result.code = ErrorCode::Internal;
        result.message = "Service not running";
        return result;
    }

    // Backends are fixed here; missing production capabilities fall back to mock
    if (!params.mock && runner_->hasLanguageModel()) {
        params.scriptBackend = ScriptBackend::Llm;
    }
    if (!params.mock && runner_->hasNetworkSpeech()) {
        params.speechBackend = SpeechBackend::Network;
    }
    if (!params.mock && (params.scriptBackend == ScriptBackend::Template ||
                         params.speechBackend == SpeechBackend::Silent)) {
        LOG_INFO("Production requested without full credentials; using script=" +
                 std::string(toString(params.scriptBackend)) + ", speech=" + toString(params.speechBackend));
    }

    try {
        Job job = store_->create(params);
        runner_->track(job.id);
        if (!pool_->submit(job.id)) {
            runner_->forget(job.id);
            (void)store_->remove(job.id, true);
            result.code = ErrorCode::Internal;
            result.message = "Failed to queue job";
            return result;
        }
        LOG_INFO("Job " + job.id + " queued (" + toString(params.mode) + ")");
        result.ok = true;
        result.job = std::move(job);
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create job: " + std::string(e.what()));
        result.code = ErrorCode::Internal;
        result.message = "Failed to create job";
        return result;
    }
}

std::optional<Job> Service::get(const JobId& id) const {
    return store_->get(id);
}

std::vector<Job> Service::list() const {
    return store_->list();
}

RemoveResult Service::remove(const JobId& id) {
    auto job = store_->get(id);
    if (!job) {
        return RemoveResult::NotFound;
    }

    if (!job->terminal()) {
        runner_->cancel(id);
        // A job no worker has picked up yet fails on the spot
        (void)failPending(id);

        const auto end = Clock::now() + config_.cancelTimeout;
        for (;;) {
            job = store_->get(id);
            if (!job) {
                return RemoveResult::NotFound;
            }
            if (job->terminal()) {
                break;
            }
            if (Clock::now() >= end) {
                LOG_WARN("Job " + id + " did not stop within the cancellation timeout");
                return RemoveResult::Busy;
            }
            std::this_thread::sleep_for(kRemovePollInterval);
        }
    }

    RemoveResult removed = store_->remove(id, true);
    if (removed == RemoveResult::Removed) {
        removeArtifacts(*job);
        LOG_INFO("Job " + id + " deleted");
    }
    runner_->forget(id);
    return removed;
}

bool Service::failPending(const JobId& id) {
    bool failed = false;
    store_->update(id, [&failed](Job& j) {
        if (j.status == JobStatus::Pending) {
            j.status = JobStatus::Failed;
            j.error = "Job cancelled";
            j.errorCode = ErrorCode::Cancelled;
            failed = true;
        }
    });
    return failed;
}

void Service::removeArtifacts(const Job& job) noexcept {
    std::error_code ec;
    if (job.outputRef && safeVideoName(*job.outputRef)) {
        std::filesystem::remove(config_.outputDir / *job.outputRef, ec);
        if (ec) {
            LOG_WARN("Failed to delete video " + *job.outputRef + ": " + ec.message());
        }
    }
    std::filesystem::remove_all(config_.jobDir(job.id), ec);
}

std::unique_ptr<std::istream> Service::openVideo(const std::string& filename) const {
    if (!safeVideoName(filename)) {
        LOG_WARN("Rejected video name: " + filename);
        return nullptr;
    }
    auto path = config_.outputDir / filename;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return nullptr;
    }
    auto stream = std::make_unique<std::ifstream>(path, std::ios::binary);
    if (!*stream) {
        return nullptr;
    }
    return stream;
}

ListingsResult Service::listings(const std::string& source, std::size_t limit,
                                 const ListingFilter& filter) const {
    ListingsResult result;
    ListingOrigin origin = ListingOrigin::Json;
    if (!parseListingOrigin(source, origin)) {
        result.code = ErrorCode::InputValidation;
        result.message = "Unknown listing source: " + source;
        return result;
    }
    try {
        result.listings = extractor_->source(origin).list(filter, limit);
        result.ok = true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to list listings: " + std::string(e.what()));
        result.code = ErrorCode::Storage;
        result.message = "Failed to read listings";
    }
    return result;
}

std::string isoTimestamp(WallClock::time_point when) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()).count() % 1000;
    std::time_t t = WallClock::to_time_t(when);
    std::tm utc{};
    gmtime_r(&t, &utc);
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
    char full[48];
    std::snprintf(full, sizeof(full), "%s.%03dZ", date, static_cast<int>(ms < 0 ? ms + 1000 : ms));
    return full;
}

nlohmann::json toJson(const Job& job) {
    nlohmann::json j;
    j["job_id"] = job.id;
    j["status"] = toString(job.status);
    j["progress"] = job.progress;
    j["current_step"] = job.currentStep ? nlohmann::json(*job.currentStep) : nlohmann::json(nullptr);
    j["video_url"] = job.status == JobStatus::Completed && job.outputRef
        ? nlohmann::json("/api/videos/" + *job.outputRef)
        : nlohmann::json(nullptr);
    j["error"] = job.error ? nlohmann::json(*job.error) : nlohmann::json(nullptr);
    j["created_at"] = isoTimestamp(job.createdAt);
    j["updated_at"] = isoTimestamp(job.updatedAt);
    return j;
}

}
