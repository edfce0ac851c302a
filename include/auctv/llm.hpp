/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

#include "auctv/types.hpp"

struct llama_model;
struct llama_context_params;
struct llama_sampler;
struct mtmd_context;

namespace auctv {

struct LlmResult {
    bool ok = false;
    std::string output;
    std::string error;
    bool timedOut = false;
    bool cancelled = false;
};

// Narration writer over llama.cpp. The model weights are shared by all
// instances; each worker owns one instance (and its vision context).
class Llm final {
public:
    Llm(const std::string& modelPath, const std::string& mmprojPath, int numWorkers = 1);
    ~Llm();

    Llm(const Llm&) = delete;
    Llm& operator=(const Llm&) = delete;
    Llm(Llm&&) = delete;
    Llm& operator=(Llm&&) = delete;

    [[nodiscard]] LlmResult generate(const std::string& prompt, const Deadline& deadline);
    // One image plus instruction. Requires an mmproj.
    [[nodiscard]] LlmResult describe(const std::string& prompt, const std::filesystem::path& image,
                                     const Deadline& deadline);
    [[nodiscard]] bool isMultimodal() const noexcept { return mtmd_ctx_ != nullptr; }

private:
    struct SamplingConfig {
        int n_predict = 0;
        int max_ctx = 0;
        float temp = 0.7f;
        int top_k = 40;
        float top_p = 0.9f;
        float min_p = 0.05f;
        float repeat_penalty = 1.1f;
        int repeat_last_n = 64;
        uint32_t seed = 0;
    };

    static std::shared_ptr<llama_model> shared_model_;
    static std::string current_model_path_;
    static std::mutex model_mutex_;

    std::shared_ptr<mtmd_context> mtmd_owned_;
    mtmd_context* mtmd_ctx_ = nullptr;

    std::string applyTemplate(const std::string& content) const;
    SamplingConfig buildSamplingConfig() const;
    void buildContextParams(int n_prompt, const SamplingConfig& config, llama_context_params& params) const;
    llama_sampler* buildSampler(const SamplingConfig& config) const;
};

// Drops <think> blocks and markdown markers so output can be spoken.
[[nodiscard]] std::string cleanForSpeech(const std::string& text);

}
