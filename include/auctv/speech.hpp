/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include "auctv/config.hpp"
#include "auctv/types.hpp"

namespace auctv {

struct SpeechResult {
    bool ok = false;
    std::filesystem::path audio;
    double seconds = 0.0;
    ErrorCode code = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

class SpeechSynthesizer {
public:
    virtual ~SpeechSynthesizer() = default;
    // Writes a WAV file to out and reports its duration.
    [[nodiscard]] virtual SpeechResult synthesize(const std::string& text, const std::string& voice,
                                                  const std::filesystem::path& out,
                                                  const Deadline& deadline) noexcept = 0;
};

// Deterministic silent track sized like spoken Korean (350 syllables/min).
class SilentSpeech final : public SpeechSynthesizer {
public:
    static constexpr double kSyllablesPerMinute = 350.0;
    static constexpr double kMinSeconds = 1.0;
    static constexpr double kMaxSeconds = 600.0;

    [[nodiscard]] static double durationFor(const std::string& text) noexcept;

    [[nodiscard]] SpeechResult synthesize(const std::string& text, const std::string& voice,
                                          const std::filesystem::path& out,
                                          const Deadline& deadline) noexcept override;
};

// Clova-style HTTPS TTS driven through the curl tool, so a cancelled job
// kills the transfer like any other subprocess. Responses are cached by
// (voice, speed, text).
class NetworkSpeech final : public SpeechSynthesizer {
public:
    NetworkSpeech(TtsSettings settings, std::filesystem::path cacheDir);

    NetworkSpeech(const NetworkSpeech&) = delete;
    NetworkSpeech& operator=(const NetworkSpeech&) = delete;

    [[nodiscard]] SpeechResult synthesize(const std::string& text, const std::string& voice,
                                          const std::filesystem::path& out,
                                          const Deadline& deadline) noexcept override;

private:
    struct Attempt {
        bool ok = false;
        bool timedOut = false;
        bool cancelled = false;
        long httpStatus = 0;
        std::string error;
    };

    [[nodiscard]] Attempt post(const std::string& text, const std::string& voice,
                               const std::filesystem::path& out, const Deadline& deadline) const;
    [[nodiscard]] bool writeHeaders(const std::filesystem::path& path) const;
    [[nodiscard]] std::filesystem::path cachePath(const std::string& text, const std::string& voice) const;

    TtsSettings settings_;
    std::filesystem::path cacheDir_;
};

// Deletes all but the keep most recently written files in dir. Returns the
// number deleted.
std::size_t pruneCache(const std::filesystem::path& dir, std::size_t keep) noexcept;

// Stable 64-bit FNV-1a, hex encoded.
[[nodiscard]] std::string contentHash(const std::string& data);

}
