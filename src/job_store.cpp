/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/job_store.hpp"
#include "auctv/logger.hpp"
#include <algorithm>
#include <cstdio>
#include <random>

namespace auctv {

Job MemoryJobStore::create(const JobParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);

    Job job;
    job.id = generateId();
    job.params = params;
    job.createdAt = WallClock::now();
    job.updatedAt = job.createdAt;

    jobs_.emplace(job.id, job);
    order_.push_back(job.id);
    LOG_DEBUG("Job created: " + job.id + " (" + toString(params.mode) + ")");
    return job;
}

std::optional<Job> MemoryJobStore::get(const JobId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Job> MemoryJobStore::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Job> result;
    result.reserve(order_.size());
    for (const auto& id : order_) {
        result.push_back(jobs_.at(id));
    }
    return result;
}

RemoveResult MemoryJobStore::remove(const JobId& id, bool force) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return RemoveResult::NotFound;
    }
    if (!force && !it->second.terminal()) {
        return RemoveResult::Busy;
    }
    jobs_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    LOG_DEBUG("Job removed: " + id);
    return RemoveResult::Removed;
}

bool MemoryJobStore::update(const JobId& id, const JobMutation& mutation) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = jobs_.find(id);
    if (it == jobs_.end()) {
        return false;
    }
    Job& current = it->second;
    if (current.terminal()) {
        LOG_TRACE("Ignoring update to terminal job: " + id);
        return false;
    }

    Job next = current;
    mutation(next);

    next.id = current.id;
    next.createdAt = current.createdAt;
    next.params = current.params;
    next.progress = std::clamp(std::max(next.progress, current.progress), 0, 100);
    if (next.status == JobStatus::Pending && current.status != JobStatus::Pending) {
        next.status = current.status;
    }
    next.updatedAt = std::max(WallClock::now(), current.updatedAt);

    current = std::move(next);
    if (observer_) {
        observer_(current);
    }
    return true;
}

void MemoryJobStore::setObserver(JobObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observer_ = std::move(observer);
}

std::size_t MemoryJobStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

// Eight hex digits; caller holds mutex_.
JobId MemoryJobStore::generateId() const {
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist;
    char buf[9];
    JobId id;
    do {
        std::snprintf(buf, sizeof(buf), "%08x", dist(rng));
        id = buf;
    } while (jobs_.count(id) > 0);
    return id;
}

}
