/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/types.hpp"
#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace auctv {

const char* toString(JobStatus status) noexcept {
    switch (status) {
        case JobStatus::Pending: return "pending";
        case JobStatus::Processing: return "processing";
        case JobStatus::Completed: return "completed";
        case JobStatus::Failed: return "failed";
        default: return "unknown";
    }
}

const char* toString(JobMode mode) noexcept {
    switch (mode) {
        case JobMode::Standard: return "standard";
        case JobMode::Document: return "document";
        default: return "unknown";
    }
}

const char* toString(ListingOrigin origin) noexcept {
    switch (origin) {
        case ListingOrigin::Json: return "json";
        case ListingOrigin::Sample: return "mock";
        default: return "unknown";
    }
}

const char* toString(ScriptBackend backend) noexcept {
    switch (backend) {
        case ScriptBackend::Template: return "template";
        case ScriptBackend::Llm: return "llm";
        default: return "unknown";
    }
}

const char* toString(SpeechBackend backend) noexcept {
    switch (backend) {
        case SpeechBackend::Silent: return "silent";
        case SpeechBackend::Network: return "network";
        default: return "unknown";
    }
}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return "none";
        case ErrorCode::InputValidation: return "input_validation";
        case ErrorCode::DataNotFound: return "data_not_found";
        case ErrorCode::ExternalService: return "external_service";
        case ErrorCode::Render: return "render";
        case ErrorCode::Storage: return "storage";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::Internal: return "internal";
        default: return "unknown";
    }
}

const char* toString(Transition transition) noexcept {
    switch (transition) {
        case Transition::Fade: return "fade";
        case Transition::Slide: return "slide";
        case Transition::Zoom: return "zoom";
        case Transition::Dissolve: return "dissolve";
        case Transition::Wipe: return "wipe";
        case Transition::Cut: return "none";
        default: return "unknown";
    }
}

namespace {

bool equalsIgnoreCase(std::string_view a, std::string_view b) noexcept {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) == std::tolower(static_cast<unsigned char>(y));
           });
}

}

bool parseListingOrigin(std::string_view text, ListingOrigin& out) noexcept {
    if (equalsIgnoreCase(text, "json")) {
        out = ListingOrigin::Json;
        return true;
    }
    if (equalsIgnoreCase(text, "mock") || equalsIgnoreCase(text, "sample")) {
        out = ListingOrigin::Sample;
        return true;
    }
    return false;
}

bool parseTransition(std::string_view text, Transition& out) noexcept {
    for (Transition t : {Transition::Fade, Transition::Slide, Transition::Zoom,
                         Transition::Dissolve, Transition::Wipe, Transition::Cut}) {
        if (equalsIgnoreCase(text, toString(t))) {
            out = t;
            return true;
        }
    }
    if (equalsIgnoreCase(text, "cut")) {
        out = Transition::Cut;
        return true;
    }
    return false;
}

std::chrono::milliseconds Deadline::remaining() const noexcept {
    if (!bounded_) {
        return std::chrono::hours(24);
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(end_ - Clock::now());
    return std::max(left, std::chrono::milliseconds(0));
}

} // namespace auctv
