/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace auctv {

// Job lifecycle states. Completed and Failed are terminal.
enum class JobStatus : std::uint8_t { Pending, Processing, Completed, Failed };

enum class JobMode : std::uint8_t { Standard, Document };

// Where a standard-mode case identifier is looked up.
enum class ListingOrigin : std::uint8_t { Json, Sample };

enum class ScriptBackend : std::uint8_t { Template, Llm };
enum class SpeechBackend : std::uint8_t { Silent, Network };

// Scene-to-scene transition. Cut joins clips with no overlap.
enum class Transition : std::uint8_t { Fade, Slide, Zoom, Dissolve, Wipe, Cut };

enum class ErrorCode : std::uint8_t {
    None = 0,
    InputValidation,
    DataNotFound,
    ExternalService,
    Render,
    Storage,
    Cancelled,
    Internal
};

// Opaque job identifier.
using JobId = std::string;

using Clock = std::chrono::steady_clock;

// Fraction of the current unit of work done, in [0, 1].
using ProgressFn = std::function<void(double)>;

[[nodiscard]] const char* toString(JobStatus status) noexcept;
[[nodiscard]] const char* toString(JobMode mode) noexcept;
[[nodiscard]] const char* toString(ListingOrigin origin) noexcept;
[[nodiscard]] const char* toString(ScriptBackend backend) noexcept;
[[nodiscard]] const char* toString(SpeechBackend backend) noexcept;
[[nodiscard]] const char* toString(ErrorCode code) noexcept;
[[nodiscard]] const char* toString(Transition transition) noexcept;

// Case-insensitive; "sample" is accepted as an alias of "mock".
[[nodiscard]] bool parseListingOrigin(std::string_view text, ListingOrigin& out) noexcept;
// Accepts the toString() names; "none" selects Cut.
[[nodiscard]] bool parseTransition(std::string_view text, Transition& out) noexcept;

// Time budget plus cooperative cancellation for one blocking operation.
// The cancel flag is owned by the caller and must outlive the deadline.
class Deadline {
public:
    Deadline() noexcept = default;
    Deadline(std::chrono::milliseconds budget, const std::atomic<bool>* cancel = nullptr) noexcept
        : end_(Clock::now() + budget), bounded_(true), cancel_(cancel) {}

    [[nodiscard]] static Deadline unbounded(const std::atomic<bool>* cancel = nullptr) noexcept {
        Deadline d;
        d.cancel_ = cancel;
        return d;
    }

    // Narrower deadline sharing the cancel flag; never extends this one.
    [[nodiscard]] Deadline within(std::chrono::milliseconds budget) const noexcept {
        Deadline d(budget, cancel_);
        if (bounded_ && end_ < d.end_) d.end_ = end_;
        return d;
    }

    [[nodiscard]] bool expired() const noexcept { return bounded_ && Clock::now() >= end_; }
    [[nodiscard]] bool cancelled() const noexcept { return cancel_ && cancel_->load(); }
    [[nodiscard]] bool stop() const noexcept { return cancelled() || expired(); }
    [[nodiscard]] bool bounded() const noexcept { return bounded_; }

    // Milliseconds left, or a large value when unbounded.
    [[nodiscard]] std::chrono::milliseconds remaining() const noexcept;

    [[nodiscard]] const std::atomic<bool>* cancelFlag() const noexcept { return cancel_; }

private:
    Clock::time_point end_{};
    bool bounded_ = false;
    const std::atomic<bool>* cancel_ = nullptr;
};

} // namespace auctv
