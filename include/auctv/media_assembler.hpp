/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "auctv/config.hpp"
#include "auctv/types.hpp"

namespace auctv {

enum class Zoom : uint8_t { In, Out };

struct SceneInput {
    std::filesystem::path image;
    std::optional<std::filesystem::path> audio;
    double narrationSeconds = 0.0;              // 0 when the scene has no narration
    std::optional<Transition> transition;       // into this scene; unset uses the render default
};

struct RenderSettings {
    int width = 1920;
    int height = 1080;
    int fps = 30;
    double transitionSeconds = 1.0;
    Transition transition = Transition::Fade;
    double defaultSceneSeconds = 4.0;
    double minTail = 0.5;                       // seconds a clip shows outside the fades
    std::string videoBitrate = "5000k";
    std::string audioBitrate = "192k";

    [[nodiscard]] static RenderSettings from(const Config& config);
};

struct PlannedClip {
    std::filesystem::path image;
    std::optional<std::filesystem::path> audio;
    double seconds = 0.0;
    int frames = 0;
    Zoom zoom = Zoom::In;
    Transition transition = Transition::Fade;   // from the previous clip; ignored on the first
    double overlap = 0.0;                       // seconds shared with the previous clip
    double offset = 0.0;                        // start in the joined stream; 0 for the first
};

// Fully resolved encoder instructions, derived once from the scene list.
struct Storyboard {
    RenderSettings settings;
    std::vector<PlannedClip> clips;
    double totalSeconds = 0.0;
};

[[nodiscard]] Storyboard planRender(const std::vector<SceneInput>& scenes, const RenderSettings& settings);

// ffmpeg xfade transition name, or nullptr for a hard cut.
[[nodiscard]] const char* xfadeName(Transition transition) noexcept;

// zoompan z expression: linear 1.0 -> 1.15 (In) or 1.15 -> 1.0 (Out).
[[nodiscard]] std::string zoomExpression(Zoom zoom, int frames);

[[nodiscard]] std::vector<std::string> clipCommand(const std::string& ffmpeg, const PlannedClip& clip,
                                                   const RenderSettings& settings,
                                                   const std::filesystem::path& out);

[[nodiscard]] std::vector<std::string> joinCommand(const std::string& ffmpeg, const Storyboard& board,
                                                   const std::vector<std::filesystem::path>& clips,
                                                   const std::filesystem::path& out);

struct RenderResult {
    bool ok = false;
    std::filesystem::path video;
    ErrorCode code = ErrorCode::None;
    std::string message;
    explicit operator bool() const noexcept { return ok; }
};

// Drives ffmpeg: one encode per scene clip, then a single join pass.
// Intermediate clips and logs never outlive assemble().
class MediaAssembler final {
public:
    explicit MediaAssembler(const Config& config) : config_(config) {}

    MediaAssembler(const MediaAssembler&) = delete;
    MediaAssembler& operator=(const MediaAssembler&) = delete;

    [[nodiscard]] RenderResult assemble(const Storyboard& board, const std::filesystem::path& workDir,
                                        const std::filesystem::path& out, const Deadline& deadline,
                                        const ProgressFn& progress) const noexcept;

private:
    [[nodiscard]] RenderResult encode(const std::vector<std::string>& argv, const std::filesystem::path& out,
                                      const std::filesystem::path& log, const Deadline& deadline) const noexcept;

    const Config& config_;
};

}
