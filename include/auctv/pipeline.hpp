/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "auctv/config.hpp"
#include "auctv/job_store.hpp"
#include "auctv/listing.hpp"
#include "auctv/media_assembler.hpp"
#include "auctv/script_generator.hpp"
#include "auctv/speech.hpp"
#include "auctv/types.hpp"

namespace auctv {

class Llm;
class SourceExtractor;

// Everything one job run accumulates between stages.
struct JobContext {
    Job job;
    std::filesystem::path workDir;
    std::vector<std::filesystem::path> images;
    std::optional<Listing> listing;
    std::vector<std::string> narration;
    std::vector<SceneInput> scenes;
    std::filesystem::path renderedVideo;
    std::string outputName;
    ScriptGenerator* script = nullptr;
    SpeechSynthesizer* speech = nullptr;
};

struct StageOutcome {
    bool ok = true;
    ErrorCode code = ErrorCode::None;
    std::string message;

    [[nodiscard]] static StageOutcome success() { return {}; }
    [[nodiscard]] static StageOutcome failure(ErrorCode code, std::string message) {
        return {false, code, std::move(message)};
    }
};

using StageFn = std::function<StageOutcome(JobContext&, const Deadline&, const ProgressFn&)>;

struct Stage {
    std::string label;
    int weight = 0;                 // share of the 0..100 progress scale
    std::chrono::seconds timeout{0};
    StageFn run;
};

// Runs one job through the ordered stages, publishing progress to the
// store. Owns the per-job cancel flags and the per-worker language models.
class PipelineRunner final {
public:
    PipelineRunner(const Config& config, JobStore& store, const SourceExtractor& extractor);
    ~PipelineRunner();

    PipelineRunner(const PipelineRunner&) = delete;
    PipelineRunner& operator=(const PipelineRunner&) = delete;
    PipelineRunner(PipelineRunner&&) = delete;
    PipelineRunner& operator=(PipelineRunner&&) = delete;

    // Loads one model instance per worker before worker threads start.
    // Without a configured model this is a no-op that returns true.
    [[nodiscard]] bool initializeModels(int numWorkers);
    [[nodiscard]] bool hasLanguageModel() const noexcept;
    [[nodiscard]] bool hasNetworkSpeech() const noexcept { return network_ != nullptr; }

    void track(const JobId& jobId);
    // Raises the job's cancel flag. False when the job is not tracked.
    bool cancel(const JobId& jobId) noexcept;
    void cancelAll() noexcept;
    void forget(const JobId& jobId) noexcept;

    void process(const JobId& jobId, int workerId) noexcept;

    [[nodiscard]] const std::vector<Stage>& stages() const noexcept { return stages_; }

    [[nodiscard]] static std::string outputName(const Job& job, WallClock::time_point when);

private:
    [[nodiscard]] std::vector<Stage> buildStages();
    [[nodiscard]] std::shared_ptr<std::atomic<bool>> flagFor(const JobId& jobId);
    [[nodiscard]] Llm* llmForWorker(int workerId);
    void finish(const JobId& jobId, const StageOutcome& outcome, const JobContext& ctx) noexcept;

    StageOutcome extractSources(JobContext& ctx, const Deadline& deadline, const ProgressFn& progress);
    StageOutcome generateScript(JobContext& ctx, const Deadline& deadline, const ProgressFn& progress);
    StageOutcome synthesizeAudio(JobContext& ctx, const Deadline& deadline, const ProgressFn& progress);
    StageOutcome assembleVideo(JobContext& ctx, const Deadline& deadline, const ProgressFn& progress);
    StageOutcome finalizeOutput(JobContext& ctx, const Deadline& deadline, const ProgressFn& progress);

    const Config& config_;
    JobStore& store_;
    const SourceExtractor& extractor_;
    MediaAssembler assembler_;
    TemplateScript template_;
    SilentSpeech silent_;
    std::unique_ptr<NetworkSpeech> network_;

    std::unordered_map<int, std::unique_ptr<Llm>> llms_;
    mutable std::mutex llmsMutex_;

    std::unordered_map<JobId, std::shared_ptr<std::atomic<bool>>> cancels_;
    std::mutex cancelMutex_;

    std::vector<Stage> stages_;
};

}
