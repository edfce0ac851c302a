/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "auctv/types.hpp"

namespace auctv {

using JobHandler = std::function<void(const JobId&, int workerId)>;

// Fixed set of render workers draining an unbounded FIFO of job ids.
class Pool {
public:
    explicit Pool(int workers) noexcept;
    ~Pool();

    Pool(const Pool&) = delete;
    Pool& operator=(const Pool&) = delete;
    Pool(Pool&&) = delete;
    Pool& operator=(Pool&&) = delete;

    [[nodiscard]] bool start(JobHandler handler);
    // Joins workers after their current job; queued ids are dropped.
    void stop() noexcept;
    [[nodiscard]] bool submit(const JobId& jobId) noexcept;

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] std::size_t queueSize() const noexcept;
    [[nodiscard]] int busyWorkers() const noexcept { return busy_.load(); }
    [[nodiscard]] int workerCount() const noexcept { return workers_; }

private:
    void workerLoop(int workerId);

    int workers_;
    JobHandler handler_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shutdown_{false};
    std::atomic<int> busy_{0};

    mutable std::mutex queueMutex_;
    std::condition_variable jobAvailable_;
    std::deque<JobId> jobQueue_;

    std::vector<std::thread> workerThreads_;
};

}
