/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>
#include <vector>

#include "auctv/types.hpp"

namespace auctv {

struct ProcessResult {
    bool ok = false;          // exited with status 0
    int exitCode = -1;
    bool timedOut = false;
    bool cancelled = false;
    bool launchFailed = false;
    std::string error;
};

// Runs argv[0] (PATH lookup, no shell) in its own process group with stdin
// on /dev/null and stdout+stderr appended to logPath (or discarded when
// empty). The child is polled until it exits, the deadline passes or the
// deadline's cancel flag is raised. In the latter two cases the whole group
// gets SIGTERM, then SIGKILL after a grace period, and is always reaped.
[[nodiscard]] ProcessResult runProcess(const std::vector<std::string>& argv,
                                       const std::filesystem::path& logPath,
                                       const Deadline& deadline) noexcept;

// Last maxBytes of a log file, for error reports.
[[nodiscard]] std::string readTail(const std::filesystem::path& path, std::size_t maxBytes = 512) noexcept;

}
