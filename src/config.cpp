/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/config.hpp"
#include "auctv/logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <thread>

namespace auctv {

int env_int(const char* name, int defv) noexcept {
    const char* v = std::getenv(name);
    if (!v || !*v) return defv;
    char* end = nullptr;
    long parsed = std::strtol(v, &end, 10);
    if (end == v) return defv;
    return static_cast<int>(parsed);
}

float env_float(const char* name, float defv) noexcept {
    const char* v = std::getenv(name);
    if (!v || !*v) return defv;
    char* end = nullptr;
    float parsed = std::strtof(v, &end);
    return end == v ? defv : parsed;
}

std::size_t env_size(const char* name, std::size_t defv) noexcept {
    const char* v = std::getenv(name);
    if (!v || !*v) return defv;
    char* end = nullptr;
    unsigned long long parsed = std::strtoull(v, &end, 10);
    if (end == v || parsed == 0) return defv;
    return static_cast<std::size_t>(parsed);
}

std::string env_string(const char* name, const std::string& defv) {
    const char* v = std::getenv(name);
    return (v && *v) ? std::string(v) : defv;
}

std::chrono::seconds env_seconds(const char* name, std::chrono::seconds defv) noexcept {
    int parsed = env_int(name, static_cast<int>(defv.count()));
    return parsed > 0 ? std::chrono::seconds(parsed) : defv;
}

Config Config::withRoot(const std::filesystem::path& root) {
    Config config;
    config.outputDir = root / "output";
    config.tempDir = root / "temp";
    config.dataDir = root / "data";
    return config;
}

Config Config::fromEnv() {
    Config config = withRoot(env_string("AUCTV_HOME", "."));
    if (const char* v = std::getenv("AUCTV_OUTPUT_DIR"); v && *v) config.outputDir = v;
    if (const char* v = std::getenv("AUCTV_TEMP_DIR"); v && *v) config.tempDir = v;
    if (const char* v = std::getenv("AUCTV_DATA_DIR"); v && *v) config.dataDir = v;

    int cores = static_cast<int>(std::thread::hardware_concurrency());
    config.workers = std::clamp(env_int("AUCTV_WORKERS", 2), 1, std::max(cores, 1) * 2);

    config.width = env_int("AUCTV_WIDTH", config.width);
    config.height = env_int("AUCTV_HEIGHT", config.height);
    config.fps = env_int("AUCTV_FPS", config.fps);
    config.transitionSeconds = env_float("AUCTV_TRANSITION", static_cast<float>(config.transitionSeconds));
    const std::string style = env_string("AUCTV_TRANSITION_STYLE", toString(config.transition));
    if (!parseTransition(style, config.transition)) {
        LOG_WARN("Unknown AUCTV_TRANSITION_STYLE '" + style + "', using fade");
        config.transition = Transition::Fade;
    }
    config.defaultSceneSeconds = env_float("AUCTV_DEFAULT_SCENE", static_cast<float>(config.defaultSceneSeconds));
    config.videoBitrate = env_string("AUCTV_VIDEO_BITRATE", config.videoBitrate);
    config.audioBitrate = env_string("AUCTV_AUDIO_BITRATE", config.audioBitrate);

    config.ffmpegPath = env_string("AUCTV_FFMPEG", config.ffmpegPath);
    config.pdftoppmPath = env_string("AUCTV_PDFTOPPM", config.pdftoppmPath);
    config.pdfinfoPath = env_string("AUCTV_PDFINFO", config.pdfinfoPath);

    config.maxDocumentBytes = env_size("AUCTV_MAX_DOCUMENT_SIZE", config.maxDocumentBytes);
    config.sourceTimeout = env_seconds("AUCTV_SOURCE_TIMEOUT", config.sourceTimeout);
    config.scriptTimeout = env_seconds("AUCTV_SCRIPT_TIMEOUT", config.scriptTimeout);
    config.speechTimeout = env_seconds("AUCTV_SPEECH_TIMEOUT", config.speechTimeout);
    config.renderTimeout = env_seconds("AUCTV_RENDER_TIMEOUT", config.renderTimeout);
    config.finalizeTimeout = env_seconds("AUCTV_FINALIZE_TIMEOUT", config.finalizeTimeout);
    config.cancelTimeout = env_seconds("AUCTV_CANCEL_TIMEOUT", config.cancelTimeout);

    config.channelName = env_string("AUCTV_CHANNEL_NAME", config.channelName);

    config.model.modelPath = env_string("AUCTV_MODEL", "");
    config.model.mmprojPath = env_string("AUCTV_MMPROJ", "");

    config.tts.endpoint = env_string("AUCTV_TTS_ENDPOINT", config.tts.endpoint);
    config.tts.clientId = env_string("AUCTV_TTS_CLIENT_ID", "");
    config.tts.clientSecret = env_string("AUCTV_TTS_CLIENT_SECRET", "");
    config.tts.voice = env_string("AUCTV_TTS_VOICE", config.tts.voice);
    config.tts.speed = std::clamp(env_int("AUCTV_TTS_SPEED", 0), -5, 10);
    config.tts.requestTimeout = env_seconds("AUCTV_TTS_REQUEST_TIMEOUT", config.tts.requestTimeout);
    config.tts.cache = env_int("AUCTV_TTS_CACHE", 1) != 0;
    config.tts.cacheKeep = env_size("AUCTV_TTS_CACHE_KEEP", config.tts.cacheKeep);
    config.tts.curlPath = env_string("AUCTV_CURL", config.tts.curlPath);

    if (config.transitionSeconds < 0.0) {
        LOG_WARN("Negative AUCTV_TRANSITION ignored");
        config.transitionSeconds = 1.0;
    }
    if (config.fps <= 0 || config.width <= 0 || config.height <= 0) {
        LOG_WARN("Invalid video geometry in environment, using 1920x1080@30");
        config.width = 1920;
        config.height = 1080;
        config.fps = 30;
    }
    return config;
}

bool Config::ensureDirectories() const noexcept {
    try {
        std::filesystem::create_directories(outputDir);
        std::filesystem::create_directories(tempDir);
        std::filesystem::create_directories(dataDir);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to create directories: " + std::string(e.what()));
        return false;
    }
}

}
