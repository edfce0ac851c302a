/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/media_assembler.hpp"
#include "auctv/logger.hpp"
#include "auctv/subprocess.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <sstream>

namespace auctv {

namespace {

constexpr double kZoomSpan = 0.15;
constexpr int kAudioRate = 48000;

std::string seconds3(double value) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.3f", value);
    return buf;
}

// Removes the listed files when it goes out of scope.
class ScopedFiles {
public:
    ScopedFiles() = default;
    ScopedFiles(const ScopedFiles&) = delete;
    ScopedFiles& operator=(const ScopedFiles&) = delete;
    ~ScopedFiles() {
        for (const auto& p : paths_) {
            std::error_code ec;
            std::filesystem::remove(p, ec);
        }
    }
    void add(const std::filesystem::path& p) { paths_.push_back(p); }

private:
    std::vector<std::filesystem::path> paths_;
};

}

RenderSettings RenderSettings::from(const Config& config) {
    RenderSettings s;
    s.width = config.width;
    s.height = config.height;
    s.fps = config.fps;
    s.transitionSeconds = config.transitionSeconds;
    s.transition = config.transition;
    s.defaultSceneSeconds = config.defaultSceneSeconds;
    s.videoBitrate = config.videoBitrate;
    s.audioBitrate = config.audioBitrate;
    return s;
}

const char* xfadeName(Transition transition) noexcept {
    switch (transition) {
        case Transition::Fade: return "fade";
        case Transition::Slide: return "slideleft";
        case Transition::Zoom: return "circleopen";
        case Transition::Dissolve: return "dissolve";
        case Transition::Wipe: return "wiperight";
        case Transition::Cut: return nullptr;
        default: return "fade";
    }
}

Storyboard planRender(const std::vector<SceneInput>& scenes, const RenderSettings& settings) {
    Storyboard board;
    board.settings = settings;
    const double floor = settings.transitionSeconds + settings.minTail;

    // elapsed is the length of the joined stream so far
    double elapsed = 0.0;
    for (std::size_t i = 0; i < scenes.size(); ++i) {
        PlannedClip clip;
        clip.image = scenes[i].image;
        clip.audio = scenes[i].audio;
        double base = scenes[i].narrationSeconds > 0.0 ? scenes[i].narrationSeconds : settings.defaultSceneSeconds;
        clip.seconds = std::max(base, floor);
        clip.frames = std::max(1, static_cast<int>(std::lround(clip.seconds * settings.fps)));
        clip.zoom = (i % 2 == 0) ? Zoom::In : Zoom::Out;
        clip.transition = scenes[i].transition.value_or(settings.transition);
        if (i > 0 && clip.transition != Transition::Cut) {
            clip.overlap = settings.transitionSeconds;
        }
        clip.offset = i == 0 ? 0.0 : elapsed - clip.overlap;
        elapsed += clip.seconds - clip.overlap;
        board.clips.push_back(std::move(clip));
    }
    board.totalSeconds = elapsed;
    return board;
}

std::string zoomExpression(Zoom zoom, int frames) {
    const int span = std::max(frames - 1, 1);
    std::ostringstream expr;
    if (zoom == Zoom::In) {
        expr << "1+" << kZoomSpan << "*on/" << span;
    } else {
        expr << (1.0 + kZoomSpan) << "-" << kZoomSpan << "*on/" << span;
    }
    return expr.str();
}

std::vector<std::string> clipCommand(const std::string& ffmpeg, const PlannedClip& clip,
                                     const RenderSettings& settings, const std::filesystem::path& out) {
    const int canvasW = settings.width * 2;
    const int canvasH = settings.height * 2;
    const std::string duration = seconds3(clip.seconds);
    const std::string size = std::to_string(settings.width) + "x" + std::to_string(settings.height);

    std::vector<std::string> argv = {ffmpeg, "-y", "-hide_banner", "-loglevel", "error",
                                     "-i", clip.image.string()};
    if (clip.audio) {
        argv.insert(argv.end(), {"-i", clip.audio->string()});
    } else {
        argv.insert(argv.end(), {"-f", "lavfi", "-i",
                                 "anullsrc=r=" + std::to_string(kAudioRate) + ":cl=stereo"});
    }

    std::ostringstream graph;
    graph << "[0:v]scale=" << canvasW << ":" << canvasH << ":force_original_aspect_ratio=decrease,"
          << "pad=" << canvasW << ":" << canvasH << ":(ow-iw)/2:(oh-ih)/2:color=black,setsar=1,"
          << "zoompan=z='" << zoomExpression(clip.zoom, clip.frames) << "'"
          << ":x='iw/2-(iw/zoom/2)':y='ih/2-(ih/zoom/2)'"
          << ":d=" << clip.frames << ":s=" << size << ":fps=" << settings.fps
          << ",format=yuv420p[v];"
          << "[1:a]aresample=" << kAudioRate << ",aformat=channel_layouts=stereo,"
          << "apad,atrim=0:" << duration << ",asetpts=PTS-STARTPTS[a]";

    argv.insert(argv.end(), {
        "-filter_complex", graph.str(),
        "-map", "[v]", "-map", "[a]",
        "-frames:v", std::to_string(clip.frames), "-t", duration,
        "-c:v", "libx264", "-preset", "medium", "-b:v", settings.videoBitrate, "-pix_fmt", "yuv420p",
        "-r", std::to_string(settings.fps),
        "-c:a", "aac", "-b:a", settings.audioBitrate, "-ar", std::to_string(kAudioRate),
        out.string()
    });
    return argv;
}

std::vector<std::string> joinCommand(const std::string& ffmpeg, const Storyboard& board,
                                     const std::vector<std::filesystem::path>& clips,
                                     const std::filesystem::path& out) {
    std::vector<std::string> argv = {ffmpeg, "-y", "-hide_banner", "-loglevel", "error"};
    for (const auto& clip : clips) {
        argv.insert(argv.end(), {"-i", clip.string()});
    }

    std::ostringstream graph;
    std::string video = "[0:v]";
    std::string audio = "[0:a]";
    for (std::size_t i = 1; i < clips.size(); ++i) {
        const PlannedClip& clip = board.clips[i];
        const std::string vOut = "[v" + std::to_string(i) + "]";
        const std::string aOut = "[a" + std::to_string(i) + "]";
        const char* effect = xfadeName(clip.transition);
        if (!effect || clip.overlap <= 0.0) {
            graph << video << "[" << i << ":v]concat=n=2:v=1:a=0" << vOut << ";";
            graph << audio << "[" << i << ":a]concat=n=2:v=0:a=1" << aOut;
        } else {
            const std::string fade = seconds3(clip.overlap);
            graph << video << "[" << i << ":v]xfade=transition=" << effect << ":duration=" << fade
                  << ":offset=" << seconds3(clip.offset) << vOut << ";";
            graph << audio << "[" << i << ":a]acrossfade=d=" << fade << aOut;
        }
        if (i + 1 < clips.size()) graph << ";";
        video = vOut;
        audio = aOut;
    }

    argv.insert(argv.end(), {
        "-filter_complex", graph.str(),
        "-map", video, "-map", audio,
        "-c:v", "libx264", "-preset", "medium", "-b:v", board.settings.videoBitrate, "-pix_fmt", "yuv420p",
        "-c:a", "aac", "-b:a", board.settings.audioBitrate,
        "-movflags", "+faststart",
        out.string()
    });
    return argv;
}

RenderResult MediaAssembler::encode(const std::vector<std::string>& argv, const std::filesystem::path& out,
                                    const std::filesystem::path& log, const Deadline& deadline) const noexcept {
    RenderResult result;
    ProcessResult run = runProcess(argv, log, deadline);
    if (run.cancelled) {
        result.code = ErrorCode::Cancelled;
        result.message = "Job cancelled";
        return result;
    }
    if (run.timedOut) {
        result.code = ErrorCode::Render;
        result.message = "Video encoding timed out";
        return result;
    }
    if (!run.ok) {
        LOG_ERROR("ffmpeg failed (" + run.error + "): " + readTail(log));
        result.code = ErrorCode::Render;
        result.message = run.launchFailed ? "Video encoder unavailable" : "Video encoding failed";
        return result;
    }
    std::error_code ec;
    auto size = std::filesystem::file_size(out, ec);
    if (ec || size == 0) {
        LOG_ERROR("ffmpeg exited cleanly but produced no output: " + out.string());
        result.code = ErrorCode::Render;
        result.message = "Video encoder produced no output";
        return result;
    }
    result.ok = true;
    result.video = out;
    return result;
}

RenderResult MediaAssembler::assemble(const Storyboard& board, const std::filesystem::path& workDir,
                                      const std::filesystem::path& out, const Deadline& deadline,
                                      const ProgressFn& progress) const noexcept {
    RenderResult result;
    try {
        if (board.clips.empty()) {
            result.code = ErrorCode::Render;
            result.message = "Nothing to render";
            return result;
        }

        auto clipDir = workDir / "clips";
        std::filesystem::create_directories(clipDir);
        ScopedFiles scratch;

        const std::size_t units = board.clips.size() + 1;
        std::vector<std::filesystem::path> clips;
        for (std::size_t i = 0; i < board.clips.size(); ++i) {
            if (deadline.cancelled()) {
                result.code = ErrorCode::Cancelled;
                result.message = "Job cancelled";
                return result;
            }
            auto clip = clipDir / ("scene_" + std::to_string(i) + ".mp4");
            auto log = clipDir / ("scene_" + std::to_string(i) + ".log");
            scratch.add(clip);
            scratch.add(log);

            RenderResult encoded = encode(clipCommand(config_.ffmpegPath, board.clips[i], board.settings, clip),
                                          clip, log, deadline);
            if (!encoded) {
                return encoded;
            }
            clips.push_back(clip);
            LOG_DEBUG("Scene clip " + std::to_string(i + 1) + "/" + std::to_string(board.clips.size()) +
                      " rendered (" + seconds3(board.clips[i].seconds) + "s)");
            if (progress) progress(static_cast<double>(i + 1) / static_cast<double>(units));
        }

        std::filesystem::remove(out);
        if (clips.size() == 1) {
            std::filesystem::copy_file(clips.front(), out);
        } else {
            auto log = clipDir / "join.log";
            scratch.add(log);
            RenderResult joined = encode(joinCommand(config_.ffmpegPath, board, clips, out), out, log, deadline);
            if (!joined) {
                std::error_code ec;
                std::filesystem::remove(out, ec);
                return joined;
            }
        }
        if (progress) progress(1.0);

        LOG_INFO("Rendered " + std::to_string(board.clips.size()) + " scene(s), " +
                 seconds3(board.totalSeconds) + "s total");
        result.ok = true;
        result.video = out;
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Render error: " + std::string(e.what()));
        std::error_code ec;
        std::filesystem::remove(out, ec);
        result.code = ErrorCode::Storage;
        result.message = "Failed to write video files";
        return result;
    }
}

}
