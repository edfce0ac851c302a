/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <string>

namespace auctv {

enum class LogLevel : uint8_t {
    ERROR = 0,
    WARN = 1,
    INFO = 2,
    DEBUG = 3,
    TRACE = 4
};

class Logger {
public:
    static void setLevel(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel level() noexcept;

    // Re-read AUCTV_LOG_LEVEL, discarding any level set programmatically.
    static void initFromEnv() noexcept;
    [[nodiscard]] static bool envOverride() noexcept;

    static void log(LogLevel level, const std::string& message) noexcept;

    static void error(const std::string& msg) noexcept { log(LogLevel::ERROR, msg); }
    static void warn(const std::string& msg) noexcept { log(LogLevel::WARN, msg); }
    static void info(const std::string& msg) noexcept { log(LogLevel::INFO, msg); }
    static void debug(const std::string& msg) noexcept { log(LogLevel::DEBUG, msg); }
    static void trace(const std::string& msg) noexcept { log(LogLevel::TRACE, msg); }

private:
    static LogLevel parseEnvLevel() noexcept;
    static const char* levelToString(LogLevel level) noexcept;
};

// Thread naming for log context
void setThreadName(const std::string& name);
std::string workerThreadName(int workerId);

}

#define LOG_ERROR(msg) ::auctv::Logger::error(msg)
#define LOG_WARN(msg)  ::auctv::Logger::warn(msg)
#define LOG_INFO(msg)  ::auctv::Logger::info(msg)
#define LOG_DEBUG(msg) ::auctv::Logger::debug(msg)
#define LOG_TRACE(msg) ::auctv::Logger::trace(msg)
