/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/speech.hpp"
#include "auctv/format.hpp"
#include "auctv/logger.hpp"
#include "auctv/subprocess.hpp"
#include "auctv/wav.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>
#include <sys/stat.h>

namespace auctv {

namespace {

constexpr int kCurlTimedOut = 28;
constexpr const char* kStatusMarker = "HTTP_STATUS:";

long parseStatus(const std::string& log) {
    auto pos = log.rfind(kStatusMarker);
    if (pos == std::string::npos) {
        return 0;
    }
    try {
        return std::stol(log.substr(pos + std::char_traits<char>::length(kStatusMarker)));
    } catch (const std::exception&) {
        return 0;
    }
}

// Removes the listed files when the scope ends.
class ScratchFiles {
public:
    explicit ScratchFiles(std::vector<std::filesystem::path> files) : files_(std::move(files)) {}
    ~ScratchFiles() {
        std::error_code ec;
        for (const auto& f : files_) {
            std::filesystem::remove(f, ec);
        }
    }
    ScratchFiles(const ScratchFiles&) = delete;
    ScratchFiles& operator=(const ScratchFiles&) = delete;

private:
    std::vector<std::filesystem::path> files_;
};

SpeechResult speechFailure(ErrorCode code, std::string message) {
    SpeechResult r;
    r.code = code;
    r.message = std::move(message);
    return r;
}

}

std::size_t pruneCache(const std::filesystem::path& dir, std::size_t keep) noexcept {
    try {
        std::error_code ec;
        std::vector<std::pair<std::filesystem::file_time_type, std::filesystem::path>> files;
        for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
            std::error_code fec;
            if (!entry.is_regular_file(fec)) continue;
            auto when = entry.last_write_time(fec);
            if (!fec) files.emplace_back(when, entry.path());
        }
        if (files.size() <= keep) {
            return 0;
        }
        // Newest first
        std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) { return a.first > b.first; });
        std::size_t deleted = 0;
        for (std::size_t i = keep; i < files.size(); ++i) {
            if (std::filesystem::remove(files[i].second, ec)) {
                ++deleted;
            }
        }
        return deleted;
    } catch (const std::exception& e) {
        LOG_WARN("Cache prune failed: " + std::string(e.what()));
        return 0;
    }
}

std::string contentHash(const std::string& data) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(hash));
    return buf;
}

double SilentSpeech::durationFor(const std::string& text) noexcept {
    const double raw = static_cast<double>(countSpokenChars(text)) * 60.0 / kSyllablesPerMinute;
    const double ms = std::round(raw * 1000.0) / 1000.0;
    return std::clamp(ms, kMinSeconds, kMaxSeconds);
}

SpeechResult SilentSpeech::synthesize(const std::string& text, const std::string& /*voice*/,
                                      const std::filesystem::path& out, const Deadline& deadline) noexcept {
    if (deadline.cancelled()) {
        return speechFailure(ErrorCode::Cancelled, "Job cancelled");
    }
    const double seconds = durationFor(text);
    if (!writeSilentWav(out, seconds)) {
        return speechFailure(ErrorCode::Storage, "Failed to write narration audio");
    }
    SpeechResult result;
    result.ok = true;
    result.audio = out;
    result.seconds = seconds;
    return result;
}

NetworkSpeech::NetworkSpeech(TtsSettings settings, std::filesystem::path cacheDir)
    : settings_(std::move(settings)), cacheDir_(std::move(cacheDir)) {}

std::filesystem::path NetworkSpeech::cachePath(const std::string& text, const std::string& voice) const {
    return cacheDir_ / (contentHash(voice + "|" + std::to_string(settings_.speed) + "|" + text) + ".wav");
}

// Credentials go through a private header file, never the argument list.
bool NetworkSpeech::writeHeaders(const std::filesystem::path& path) const {
    std::ofstream file(path, std::ios::trunc);
    if (!file) {
        return false;
    }
    ::chmod(path.c_str(), S_IRUSR | S_IWUSR);
    file << "X-NCP-APIGW-API-KEY-ID: " << settings_.clientId << "\n";
    file << "X-NCP-APIGW-API-KEY: " << settings_.clientSecret << "\n";
    return static_cast<bool>(file.flush());
}

NetworkSpeech::Attempt NetworkSpeech::post(const std::string& text, const std::string& voice,
                                           const std::filesystem::path& out, const Deadline& deadline) const {
    Attempt attempt;
    auto headers = out;
    headers += ".headers";
    auto log = out;
    log += ".log";
    ScratchFiles scratch({headers, log});

    if (!writeHeaders(headers)) {
        attempt.error = "Cannot write request headers";
        return attempt;
    }

    const auto budget = std::min(deadline.remaining(), std::chrono::milliseconds(settings_.requestTimeout));
    char maxTime[32];
    std::snprintf(maxTime, sizeof(maxTime), "%.3f", std::max<long long>(budget.count(), 1) / 1000.0);

    std::vector<std::string> argv = {
        settings_.curlPath, "-s", "-S", "-X", "POST",
        "--max-time", maxTime,
        "--connect-timeout", "10",
        "-H", "@" + headers.string(),
        "-o", out.string(),
        "-w", std::string("\n") + kStatusMarker + "%{http_code}\n",
        "--data-urlencode", "speaker=" + voice,
        "--data-urlencode", "volume=0",
        "--data-urlencode", "speed=" + std::to_string(settings_.speed),
        "--data-urlencode", "pitch=0",
        "--data-urlencode", "format=wav",
        "--data-urlencode", "text=" + text,
        settings_.endpoint,
    };

    // Outer guard in case the tool ignores --max-time
    ProcessResult proc = runProcess(argv, log, deadline.within(budget + std::chrono::seconds(5)));
    attempt.httpStatus = parseStatus(readTail(log, 256));

    if (proc.cancelled) {
        attempt.cancelled = true;
        attempt.error = "cancelled";
    } else if (proc.launchFailed) {
        attempt.error = "curl unavailable";
    } else if (proc.timedOut || proc.exitCode == kCurlTimedOut) {
        attempt.timedOut = true;
        attempt.error = "request timed out";
    } else if (!proc.ok) {
        attempt.error = "curl exited with " + std::to_string(proc.exitCode) + ": " + readTail(log, 256);
    } else if (attempt.httpStatus >= 400 || attempt.httpStatus == 0) {
        attempt.error = "HTTP " + std::to_string(attempt.httpStatus);
    } else {
        attempt.ok = true;
    }
    return attempt;
}

SpeechResult NetworkSpeech::synthesize(const std::string& text, const std::string& voice,
                                       const std::filesystem::path& out, const Deadline& deadline) noexcept {
    try {
        if (deadline.cancelled()) {
            return speechFailure(ErrorCode::Cancelled, "Job cancelled");
        }
        const std::string speaker = voice.empty() ? settings_.voice : voice;
        std::error_code ec;

        if (settings_.cache) {
            auto cached = cachePath(text, speaker);
            if (auto info = probeWav(cached); info && info->seconds() > 0.0) {
                std::filesystem::copy_file(cached, out, std::filesystem::copy_options::overwrite_existing, ec);
                if (!ec) {
                    // Hits count as recent use for pruning
                    std::filesystem::last_write_time(cached, std::filesystem::file_time_type::clock::now(), ec);
                    LOG_DEBUG("Narration cache hit: " + cached.filename().string());
                    SpeechResult hit;
                    hit.ok = true;
                    hit.audio = out;
                    hit.seconds = info->seconds();
                    return hit;
                }
            }
        }

        Attempt attempt = post(text, speaker, out, deadline);
        if (attempt.timedOut && !deadline.stop()) {
            LOG_WARN("TTS request timed out, retrying once");
            attempt = post(text, speaker, out, deadline);
        }

        if (!attempt.ok) {
            std::filesystem::remove(out, ec);
            if (attempt.cancelled || deadline.cancelled()) {
                return speechFailure(ErrorCode::Cancelled, "Job cancelled");
            }
            LOG_ERROR("TTS request failed: " + attempt.error);
            if (attempt.timedOut) {
                return speechFailure(ErrorCode::ExternalService, "Speech synthesis timed out");
            }
            return speechFailure(ErrorCode::ExternalService, "Speech synthesis failed");
        }

        auto info = probeWav(out);
        if (!info || info->seconds() <= 0.0) {
            LOG_ERROR("TTS response is not usable WAV audio (" + std::to_string(attempt.httpStatus) + ")");
            std::filesystem::remove(out, ec);
            return speechFailure(ErrorCode::ExternalService, "Speech synthesis returned unreadable audio");
        }

        if (settings_.cache) {
            std::filesystem::create_directories(cacheDir_, ec);
            std::filesystem::copy_file(out, cachePath(text, speaker),
                                       std::filesystem::copy_options::overwrite_existing, ec);
            if (ec) {
                LOG_WARN("Failed to cache narration: " + ec.message());
            } else {
                std::size_t pruned = pruneCache(cacheDir_, settings_.cacheKeep);
                if (pruned > 0) {
                    LOG_DEBUG("Pruned " + std::to_string(pruned) + " cached narration file(s)");
                }
            }
        }

        SpeechResult result;
        result.ok = true;
        result.audio = out;
        result.seconds = info->seconds();
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Speech synthesis error: " + std::string(e.what()));
        return speechFailure(ErrorCode::ExternalService, "Speech synthesis failed");
    }
}

}
