/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

#include "auctv/types.hpp"

namespace auctv {

// Environment helpers. Unset, empty or unparsable values yield the default.
[[nodiscard]] int env_int(const char* name, int defv) noexcept;
[[nodiscard]] float env_float(const char* name, float defv) noexcept;
[[nodiscard]] std::size_t env_size(const char* name, std::size_t defv) noexcept;
[[nodiscard]] std::string env_string(const char* name, const std::string& defv);
[[nodiscard]] std::chrono::seconds env_seconds(const char* name, std::chrono::seconds defv) noexcept;

struct TtsSettings {
    std::string endpoint = "https://naveropenapi.apigw.ntruss.com/tts-premium/v1/tts";
    std::string clientId;
    std::string clientSecret;
    std::string voice = "nara";
    int speed = 0;
    std::string curlPath = "curl";
    std::chrono::seconds requestTimeout{30};
    bool cache = true;
    std::size_t cacheKeep = 100;                // newest cached responses kept after each insert

    [[nodiscard]] bool configured() const noexcept {
        return !endpoint.empty() && !clientId.empty() && !clientSecret.empty();
    }
};

struct ModelSettings {
    std::string modelPath;
    std::string mmprojPath;

    [[nodiscard]] bool configured() const noexcept { return !modelPath.empty(); }
};

// Immutable settings snapshot. Read once at startup via fromEnv(); tests
// build values with withRoot() and override fields directly.
struct Config {
    std::filesystem::path outputDir;
    std::filesystem::path tempDir;
    std::filesystem::path dataDir;

    int workers = 2;

    int width = 1920;
    int height = 1080;
    int fps = 30;
    double transitionSeconds = 1.0;
    Transition transition = Transition::Fade;
    double defaultSceneSeconds = 4.0;
    std::string videoBitrate = "5000k";
    std::string audioBitrate = "192k";

    std::string ffmpegPath = "ffmpeg";
    std::string pdftoppmPath = "pdftoppm";
    std::string pdfinfoPath = "pdfinfo";

    std::size_t maxDocumentBytes = 50ULL * 1024 * 1024;
    std::chrono::seconds sourceTimeout{300};
    std::chrono::seconds scriptTimeout{600};
    std::chrono::seconds speechTimeout{300};
    std::chrono::seconds renderTimeout{900};
    std::chrono::seconds finalizeTimeout{60};
    std::chrono::seconds cancelTimeout{10};

    std::string channelName = "경매TV";

    ModelSettings model;
    TtsSettings tts;

    [[nodiscard]] static Config withRoot(const std::filesystem::path& root);
    [[nodiscard]] static Config fromEnv();

    [[nodiscard]] std::filesystem::path listingsDir() const { return dataDir / "input"; }
    [[nodiscard]] std::filesystem::path listingImagesDir() const { return dataDir / "input" / "images"; }
    [[nodiscard]] std::filesystem::path sampleListingsFile() const { return dataDir / "mock" / "sample_properties.json"; }
    [[nodiscard]] std::filesystem::path sampleImagesDir() const { return dataDir / "mock" / "images"; }
    [[nodiscard]] std::filesystem::path audioCacheDir() const { return tempDir / "audio_cache"; }
    [[nodiscard]] std::filesystem::path jobDir(const std::string& jobId) const { return tempDir / jobId; }

    [[nodiscard]] bool ensureDirectories() const noexcept;
};

}
