/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/subprocess.hpp"
#include "auctv/logger.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace auctv {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);
constexpr auto kTermGrace = std::chrono::milliseconds(500);

int decodeStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// SIGTERM the group, give it kTermGrace, then SIGKILL. Always reaps pid.
int terminateGroup(pid_t pid) {
    ::kill(-pid, SIGTERM);
    int status = 0;
    auto until = Clock::now() + kTermGrace;
    while (Clock::now() < until) {
        pid_t r = ::waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            return decodeStatus(status);
        }
        if (r < 0 && errno != EINTR) {
            return -1;
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    ::kill(-pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    return decodeStatus(status);
}

std::string commandName(const std::vector<std::string>& argv) {
    return argv.empty() ? std::string("<empty>") : argv.front();
}

}

ProcessResult runProcess(const std::vector<std::string>& argv,
                         const std::filesystem::path& logPath,
                         const Deadline& deadline) noexcept {
    ProcessResult result;
    if (argv.empty()) {
        result.launchFailed = true;
        result.error = "Empty command";
        return result;
    }
    if (deadline.stop()) {
        result.cancelled = deadline.cancelled();
        result.timedOut = !result.cancelled;
        result.error = result.cancelled ? "Cancelled before start" : "Deadline passed before start";
        return result;
    }

    try {
        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) {
            args.push_back(const_cast<char*>(a.c_str()));
        }
        args.push_back(nullptr);

        std::string logTarget = logPath.empty() ? std::string("/dev/null") : logPath.string();
        int outFd = ::open(logTarget.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
        if (outFd < 0) {
            result.launchFailed = true;
            result.error = "Cannot open log " + logTarget + ": " + std::strerror(errno);
            return result;
        }
        int nullFd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);

        LOG_DEBUG("exec: " + commandName(argv) + " (" + std::to_string(argv.size() - 1) + " args)");

        pid_t pid = ::fork();
        if (pid < 0) {
            int err = errno;
            ::close(outFd);
            if (nullFd >= 0) ::close(nullFd);
            result.launchFailed = true;
            result.error = "fork failed: " + std::string(std::strerror(err));
            return result;
        }

        if (pid == 0) {
            // Child: only async-signal-safe calls from here on
            ::setpgid(0, 0);
            if (nullFd >= 0) ::dup2(nullFd, STDIN_FILENO);
            ::dup2(outFd, STDOUT_FILENO);
            ::dup2(outFd, STDERR_FILENO);
            ::execvp(args[0], args.data());
            _exit(127);
        }

        ::setpgid(pid, pid);
        ::close(outFd);
        if (nullFd >= 0) ::close(nullFd);

        int status = 0;
        for (;;) {
            pid_t r = ::waitpid(pid, &status, WNOHANG);
            if (r == pid) {
                result.exitCode = decodeStatus(status);
                break;
            }
            if (r < 0 && errno != EINTR) {
                result.error = "waitpid failed: " + std::string(std::strerror(errno));
                ::kill(-pid, SIGKILL);
                return result;
            }
            if (deadline.cancelled()) {
                LOG_DEBUG("Cancelling " + commandName(argv) + " (pid " + std::to_string(pid) + ")");
                result.exitCode = terminateGroup(pid);
                result.cancelled = true;
                result.error = commandName(argv) + " cancelled";
                return result;
            }
            if (deadline.expired()) {
                LOG_WARN(commandName(argv) + " timed out (pid " + std::to_string(pid) + ")");
                result.exitCode = terminateGroup(pid);
                result.timedOut = true;
                result.error = commandName(argv) + " timed out";
                return result;
            }
            std::this_thread::sleep_for(kPollInterval);
        }

        if (result.exitCode == 127) {
            result.launchFailed = true;
            result.error = commandName(argv) + " could not be executed";
        } else if (result.exitCode != 0) {
            result.error = commandName(argv) + " exited with status " + std::to_string(result.exitCode);
        }
        result.ok = result.exitCode == 0;
        return result;
    } catch (const std::exception& e) {
        result.error = "Process launch error: " + std::string(e.what());
        return result;
    }
}

std::string readTail(const std::filesystem::path& path, std::size_t maxBytes) noexcept {
    try {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        if (!file) return "";
        auto size = static_cast<std::size_t>(file.tellg());
        std::size_t start = size > maxBytes ? size - maxBytes : 0;
        file.seekg(static_cast<std::streamoff>(start));
        std::string tail(size - start, '\0');
        file.read(&tail[0], static_cast<std::streamsize>(tail.size()));
        return tail;
    } catch (const std::exception&) {
        return "";
    }
}

}
