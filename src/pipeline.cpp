/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/pipeline.hpp"
#include "auctv/llm.hpp"
#include "auctv/logger.hpp"
#include "auctv/source_extractor.hpp"
#include <algorithm>
#include <cstdio>
#include <ctime>

namespace auctv {

namespace {

// Stage failures that are not self-describing pick up the cancel state.
StageOutcome cancelled() {
    return StageOutcome::failure(ErrorCode::Cancelled, "Job cancelled");
}

bool moveFile(const std::filesystem::path& from, const std::filesystem::path& to, std::string& error) {
    std::error_code ec;
    std::filesystem::rename(from, to, ec);
    if (!ec) {
        return true;
    }
    // Different filesystem: copy under a temporary name, then publish
    auto partial = to;
    partial += ".partial";
    std::filesystem::copy_file(from, partial, std::filesystem::copy_options::overwrite_existing, ec);
    if (!ec) {
        std::filesystem::rename(partial, to, ec);
    }
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(partial, ignored);
        error = ec.message();
        return false;
    }
    std::filesystem::remove(from, ec);
    return true;
}

}

PipelineRunner::PipelineRunner(const Config& config, JobStore& store, const SourceExtractor& extractor)
    : config_(config), store_(store), extractor_(extractor), assembler_(config) {
    if (config_.tts.configured()) {
        network_ = std::make_unique<NetworkSpeech>(config_.tts, config_.audioCacheDir());
    }
    stages_ = buildStages();
}

PipelineRunner::~PipelineRunner() = default;

std::vector<Stage> PipelineRunner::buildStages() {
    using namespace std::placeholders;
    std::vector<Stage> stages;
    stages.push_back({"extracting-sources", 10, config_.sourceTimeout,
                      std::bind(&PipelineRunner::extractSources, this, _1, _2, _3)});
    stages.push_back({"generating-script", 25, config_.scriptTimeout,
                      std::bind(&PipelineRunner::generateScript, this, _1, _2, _3)});
    stages.push_back({"synthesizing-audio", 35, config_.speechTimeout,
                      std::bind(&PipelineRunner::synthesizeAudio, this, _1, _2, _3)});
    stages.push_back({"assembling-video", 25, config_.renderTimeout,
                      std::bind(&PipelineRunner::assembleVideo, this, _1, _2, _3)});
    stages.push_back({"finalizing", 5, config_.finalizeTimeout,
                      std::bind(&PipelineRunner::finalizeOutput, this, _1, _2, _3)});
    return stages;
}

bool PipelineRunner::initializeModels(int numWorkers) {
    if (!config_.model.configured()) {
        LOG_DEBUG("No language model configured; production scripts unavailable");
        return true;
    }
    std::lock_guard<std::mutex> lock(llmsMutex_);
    try {
        for (int i = 0; i < numWorkers; ++i) {
            llms_[i] = std::make_unique<Llm>(config_.model.modelPath, config_.model.mmprojPath, numWorkers);
        }
        LOG_DEBUG("Language model ready for " + std::to_string(numWorkers) + " worker(s)");
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to initialize language model: " + std::string(e.what()));
        llms_.clear();
        return false;
    }
}

bool PipelineRunner::hasLanguageModel() const noexcept {
    std::lock_guard<std::mutex> lock(llmsMutex_);
    return !llms_.empty();
}

Llm* PipelineRunner::llmForWorker(int workerId) {
    std::lock_guard<std::mutex> lock(llmsMutex_);
    auto it = llms_.find(workerId);
    return it == llms_.end() ? nullptr : it->second.get();
}

void PipelineRunner::track(const JobId& jobId) {
    (void)flagFor(jobId);
}

std::shared_ptr<std::atomic<bool>> PipelineRunner::flagFor(const JobId& jobId) {
    std::lock_guard<std::mutex> lock(cancelMutex_);
    auto& flag = cancels_[jobId];
    if (!flag) {
        flag = std::make_shared<std::atomic<bool>>(false);
    }
    return flag;
}

bool PipelineRunner::cancel(const JobId& jobId) noexcept {
    std::lock_guard<std::mutex> lock(cancelMutex_);
    auto it = cancels_.find(jobId);
    if (it == cancels_.end()) {
        return false;
    }
    it->second->store(true);
    LOG_INFO("Cancellation requested: " + jobId);
    return true;
}

void PipelineRunner::cancelAll() noexcept {
    std::lock_guard<std::mutex> lock(cancelMutex_);
    for (auto& entry : cancels_) {
        entry.second->store(true);
    }
}

void PipelineRunner::forget(const JobId& jobId) noexcept {
    std::lock_guard<std::mutex> lock(cancelMutex_);
    cancels_.erase(jobId);
}

std::string PipelineRunner::outputName(const Job& job, WallClock::time_point when) {
    std::string base = job.params.mode == JobMode::Document
        ? safeCaseName(job.params.document.stem().string())
        : safeCaseName(job.params.caseId);
    if (base.empty()) {
        base = "document";
    }
    std::time_t t = WallClock::to_time_t(when);
    std::tm local{};
    localtime_r(&t, &local);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);
    return base + "_" + stamp + "_" + job.id + ".mp4";
}

void PipelineRunner::process(const JobId& jobId, int workerId) noexcept {
    auto snapshot = store_.get(jobId);
    if (!snapshot || snapshot->terminal()) {
        LOG_DEBUG("Skipping job no longer pending: " + jobId);
        forget(jobId);
        return;
    }

    JobContext ctx;
    ctx.job = *snapshot;
    ctx.workDir = config_.jobDir(jobId);
    StageOutcome outcome = StageOutcome::success();

    try {
        auto flag = flagFor(jobId);
        std::unique_ptr<ScriptGenerator> llmScript;

        if (ctx.job.params.scriptBackend == ScriptBackend::Llm) {
            if (Llm* llm = llmForWorker(workerId)) {
                llmScript = std::make_unique<LlmScript>(*llm);
                ctx.script = llmScript.get();
            }
        } else {
            ctx.script = &template_;
        }
        ctx.speech = ctx.job.params.speechBackend == SpeechBackend::Network
            ? static_cast<SpeechSynthesizer*>(network_.get())
            : static_cast<SpeechSynthesizer*>(&silent_);

        const bool started = store_.update(jobId, [&](Job& job) {
            job.status = JobStatus::Processing;
            job.currentStep = stages_.front().label;
        });
        if (!started) {
            LOG_DEBUG("Job finished before it started: " + jobId);
            forget(jobId);
            return;
        }
        LOG_INFO("Job " + jobId + " started (" + toString(ctx.job.params.mode) + ", script=" +
                 toString(ctx.job.params.scriptBackend) + ", speech=" +
                 toString(ctx.job.params.speechBackend) + ")");

        std::error_code dirError;
        std::filesystem::create_directories(ctx.workDir, dirError);
        if (dirError) {
            LOG_ERROR("Failed to create work directory " + ctx.workDir.string() + ": " + dirError.message());
            outcome = StageOutcome::failure(ErrorCode::Storage, "Failed to create work directory");
        }

        int base = 0;
        for (const Stage& stage : stages_) {
            if (!outcome.ok) {
                break;
            }
            if (flag->load()) {
                outcome = cancelled();
                break;
            }
            store_.update(jobId, [&](Job& job) {
                job.currentStep = stage.label;
                job.progress = base;
            });

            int reported = base;
            const int stageBase = base;
            const int weight = stage.weight;
            ProgressFn progress = [&, stageBase, weight](double fraction) {
                const int value = stageBase + static_cast<int>(weight * std::clamp(fraction, 0.0, 1.0));
                if (value > reported) {
                    reported = value;
                    store_.update(jobId, [value](Job& job) { job.progress = value; });
                }
            };

            LOG_DEBUG("Job " + jobId + " stage " + stage.label);
            Deadline deadline(std::chrono::duration_cast<std::chrono::milliseconds>(stage.timeout), flag.get());
            outcome = stage.run(ctx, deadline, progress);
            if (!outcome.ok) {
                if (flag->load()) {
                    outcome = cancelled();
                }
                LOG_WARN("Job " + jobId + " failed at " + stage.label + ": " + outcome.message);
                break;
            }
            base += stage.weight;
        }

        if (outcome.ok && flag->load()) {
            outcome = cancelled();
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected error in job " + jobId + ": " + e.what());
        outcome = StageOutcome::failure(ErrorCode::Internal, "Internal error");
    }

    finish(jobId, outcome, ctx);
}

void PipelineRunner::finish(const JobId& jobId, const StageOutcome& outcome, const JobContext& ctx) noexcept {
    // Scratch goes first so a terminal status implies no temp files remain
    std::error_code ec;
    std::filesystem::remove_all(ctx.workDir, ec);
    if (ec) {
        LOG_WARN("Failed to clean work directory for " + jobId + ": " + ec.message());
    }

    bool recorded = false;
    if (outcome.ok) {
        recorded = store_.update(jobId, [&](Job& job) {
            job.status = JobStatus::Completed;
            job.progress = 100;
            job.currentStep = "completed";
            job.outputRef = ctx.outputName;
        });
        if (recorded) {
            LOG_INFO("Job " + jobId + " completed -> " + ctx.outputName);
        }
    } else {
        if (!ctx.outputName.empty()) {
            std::filesystem::remove(config_.outputDir / ctx.outputName, ec);
        }
        recorded = store_.update(jobId, [&](Job& job) {
            job.status = JobStatus::Failed;
            job.error = outcome.message;
            job.errorCode = outcome.code;
        });
    }

    if (!recorded) {
        // Record vanished or was finalized elsewhere; drop any artifact we produced
        if (outcome.ok && !ctx.outputName.empty()) {
            std::filesystem::remove(config_.outputDir / ctx.outputName, ec);
        }
        LOG_DEBUG("Job " + jobId + " result discarded");
    }
    forget(jobId);
}

StageOutcome PipelineRunner::extractSources(JobContext& ctx, const Deadline& deadline, const ProgressFn& progress) {
    SourceResult sources;
    if (ctx.job.params.mode == JobMode::Document) {
        sources = extractor_.extractDocument(ctx.job.params.document, ctx.workDir, deadline);
    } else {
        sources = extractor_.extractStandard(ctx.job.params.caseId, ctx.job.params.origin,
                                             ctx.workDir, deadline, progress);
    }
    if (!sources) {
        if (deadline.expired() && sources.code != ErrorCode::Cancelled) {
            return StageOutcome::failure(ErrorCode::ExternalService, "Source extraction timed out");
        }
        return StageOutcome::failure(sources.code, sources.message);
    }
    ctx.images = std::move(sources.images);
    ctx.listing = std::move(sources.listing);
    return StageOutcome::success();
}

StageOutcome PipelineRunner::generateScript(JobContext& ctx, const Deadline& deadline, const ProgressFn& progress) {
    if (!ctx.script) {
        return StageOutcome::failure(ErrorCode::ExternalService, "Language model unavailable");
    }
    ScriptRequest request;
    request.mode = ctx.job.params.mode;
    request.listing = ctx.listing ? &*ctx.listing : nullptr;
    request.images = ctx.images;
    request.channelName = config_.channelName;

    ScriptResult script = ctx.script->generate(request, deadline, progress);
    if (!script) {
        return StageOutcome::failure(script.code, script.message);
    }
    if (script.narration.size() != ctx.images.size()) {
        return StageOutcome::failure(ErrorCode::Internal, "Narration does not match scenes");
    }
    ctx.narration = std::move(script.narration);
    return StageOutcome::success();
}

StageOutcome PipelineRunner::synthesizeAudio(JobContext& ctx, const Deadline& deadline, const ProgressFn& progress) {
    if (!ctx.speech) {
        return StageOutcome::failure(ErrorCode::ExternalService, "Speech provider unavailable");
    }
    auto audioDir = ctx.workDir / "audio";
    std::error_code ec;
    std::filesystem::create_directories(audioDir, ec);
    if (ec) {
        return StageOutcome::failure(ErrorCode::Storage, "Failed to create audio directory");
    }

    const std::size_t n = ctx.images.size();
    ctx.scenes.clear();
    ctx.scenes.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        SceneInput scene;
        scene.image = ctx.images[i];
        if (!ctx.narration[i].empty()) {
            char name[32];
            std::snprintf(name, sizeof(name), "scene_%03zu.wav", i);
            SpeechResult speech = ctx.speech->synthesize(ctx.narration[i], config_.tts.voice,
                                                         audioDir / name, deadline);
            if (!speech) {
                return StageOutcome::failure(speech.code, speech.message);
            }
            scene.audio = speech.audio;
            scene.narrationSeconds = speech.seconds;
        }
        ctx.scenes.push_back(std::move(scene));
        progress(static_cast<double>(i + 1) / static_cast<double>(n));
    }
    return StageOutcome::success();
}

StageOutcome PipelineRunner::assembleVideo(JobContext& ctx, const Deadline& deadline, const ProgressFn& progress) {
    Storyboard board = planRender(ctx.scenes, RenderSettings::from(config_));
    LOG_DEBUG("Render plan: " + std::to_string(board.clips.size()) + " clip(s), " +
              std::to_string(board.totalSeconds) + "s");
    RenderResult rendered = assembler_.assemble(board, ctx.workDir, ctx.workDir / "render.mp4", deadline, progress);
    if (!rendered) {
        return StageOutcome::failure(rendered.code, rendered.message);
    }
    ctx.renderedVideo = rendered.video;
    return StageOutcome::success();
}

StageOutcome PipelineRunner::finalizeOutput(JobContext& ctx, const Deadline& deadline, const ProgressFn& progress) {
    if (deadline.cancelled()) {
        return cancelled();
    }
    std::error_code ec;
    std::filesystem::create_directories(config_.outputDir, ec);
    if (ec) {
        return StageOutcome::failure(ErrorCode::Storage, "Output directory unavailable");
    }
    const std::string name = outputName(ctx.job, WallClock::now());
    std::string error;
    if (!moveFile(ctx.renderedVideo, config_.outputDir / name, error)) {
        LOG_ERROR("Failed to store video " + name + ": " + error);
        return StageOutcome::failure(ErrorCode::Storage, "Failed to store video");
    }
    ctx.outputName = name;
    progress(1.0);
    return StageOutcome::success();
}

}
