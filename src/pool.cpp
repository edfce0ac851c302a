/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/pool.hpp"
#include "auctv/logger.hpp"

namespace auctv {

Pool::Pool(int workers) noexcept : workers_(workers > 0 ? workers : 1) {
    LOG_DEBUG("Pool created with " + std::to_string(workers_) + " workers");
}

Pool::~Pool() {
    stop();
}

bool Pool::start(JobHandler handler) {
    if (running_.load()) {
        LOG_WARN("Pool already running");
        return false;
    }
    if (!handler) {
        LOG_ERROR("Invalid job handler provided");
        return false;
    }

    handler_ = std::move(handler);
    shutdown_.store(false);
    running_.store(true);

    try {
        workerThreads_.reserve(static_cast<std::size_t>(workers_));
        for (int i = 0; i < workers_; ++i) {
            workerThreads_.emplace_back(&Pool::workerLoop, this, i);
        }
        LOG_INFO("Render pool started with " + std::to_string(workers_) + " worker(s)");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to start pool: " + std::string(e.what()));
        stop();
        return false;
    }
}

void Pool::stop() noexcept {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_DEBUG("Stopping pool...");
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        shutdown_.store(true);
    }
    jobAvailable_.notify_all();

    for (auto& thread : workerThreads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    workerThreads_.clear();

    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        dropped = jobQueue_.size();
        jobQueue_.clear();
    }
    if (dropped > 0) {
        LOG_WARN("Pool stopped with " + std::to_string(dropped) + " queued job(s) not started");
    }
    LOG_INFO("Pool stopped");
}

bool Pool::submit(const JobId& jobId) noexcept {
    if (!running_.load() || shutdown_.load()) {
        LOG_WARN("Cannot submit job to stopped pool: " + jobId);
        return false;
    }
    try {
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            jobQueue_.push_back(jobId);
        }
        jobAvailable_.notify_one();
        LOG_DEBUG("Job queued: " + jobId);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to queue job " + jobId + ": " + e.what());
        return false;
    }
}

std::size_t Pool::queueSize() const noexcept {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return jobQueue_.size();
}

void Pool::workerLoop(int workerId) {
    const std::string name = workerThreadName(workerId);
    setThreadName(name);
    LOG_DEBUG(name + " started");

    for (;;) {
        JobId jobId;
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            jobAvailable_.wait(lock, [this] {
                return !jobQueue_.empty() || shutdown_.load();
            });
            if (shutdown_.load()) {
                break;
            }
            jobId = std::move(jobQueue_.front());
            jobQueue_.pop_front();
        }

        busy_.fetch_add(1);
        try {
            handler_(jobId, workerId);
        } catch (const std::exception& e) {
            LOG_ERROR(name + " job error: " + std::string(e.what()) + " (job: " + jobId + ")");
        }
        busy_.fetch_sub(1);
    }

    LOG_DEBUG(name + " stopped");
}

}
