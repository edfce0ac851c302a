/*
 * auctv - Auction Listing Video Renderer
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "auctv/llm.hpp"
#include "auctv/config.hpp"
#include "auctv/format.hpp"
#include "auctv/logger.hpp"
#include "llama.h"
#include "mtmd.h"
#include "mtmd-helper.h"
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <regex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace auctv {

std::shared_ptr<llama_model> Llm::shared_model_ = nullptr;
std::string Llm::current_model_path_;
std::mutex Llm::model_mutex_;

// mtmd_helper_eval_chunks shares GGML graph state across contexts, so
// image encoding is serialized process-wide.
static std::mutex vision_encoding_mutex_;

namespace {

struct ContextDeleter {
    void operator()(llama_context* ctx) const noexcept { llama_free(ctx); }
};
struct SamplerDeleter {
    void operator()(llama_sampler* smpl) const noexcept { llama_sampler_free(smpl); }
};
struct ChunksDeleter {
    void operator()(mtmd_input_chunks* chunks) const noexcept { mtmd_input_chunks_free(chunks); }
};
struct BitmapDeleter {
    void operator()(mtmd_bitmap* bmp) const noexcept { mtmd_bitmap_free(bmp); }
};

using ContextPtr = std::unique_ptr<llama_context, ContextDeleter>;
using SamplerPtr = std::unique_ptr<llama_sampler, SamplerDeleter>;

void filtered_llama_log(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    if (!text || text[0] == '.' || text[0] == '\n' || text[0] == '\0') {
        return;
    }

    static int filter_level = -1;
    if (filter_level == -1) {
        const std::string env = env_string("LLAMA_LOG_LEVEL", "error");
        filter_level = env == "info" ? GGML_LOG_LEVEL_INFO :
                       env == "warn" ? GGML_LOG_LEVEL_WARN :
                       env == "debug" ? GGML_LOG_LEVEL_DEBUG :
                       GGML_LOG_LEVEL_ERROR;
    }

    if (level >= filter_level) {
        std::fprintf(stderr, "%s", text);
    }
}

LlmResult stopped(const Deadline& deadline) {
    LlmResult r;
    r.cancelled = deadline.cancelled();
    r.timedOut = !r.cancelled;
    r.error = r.cancelled ? "Generation cancelled" : "Generation timed out";
    return r;
}

// Samples until end-of-generation, n_predict tokens or the deadline.
// decodeNext feeds the sampled token back into the context.
template <typename DecodeNext>
LlmResult sampleLoop(llama_context* ctx, llama_sampler* smpl, const llama_vocab* vocab,
                     int n_predict, const Deadline& deadline, DecodeNext decodeNext) {
    std::string output;
    for (int i = 0; i < n_predict; ++i) {
        if (deadline.stop()) {
            return stopped(deadline);
        }
        llama_token token = llama_sampler_sample(smpl, ctx, -1);
        llama_sampler_accept(smpl, token);
        if (llama_vocab_is_eog(vocab, token)) {
            break;
        }
        char buf[128];
        int n = llama_token_to_piece(vocab, token, buf, sizeof(buf), 0, true);
        if (n < 0) {
            return {false, "", "Failed to convert token to text"};
        }
        output.append(buf, n);
        if (!decodeNext(token)) {
            return {false, "", "Failed to decode"};
        }
    }
    return {true, output, ""};
}

}

std::string cleanForSpeech(const std::string& text) {
    static const std::regex thinkRegex("<think>[\\s\\S]*?</think>");
    static const std::regex markdownRegex("(```[a-z]*|#{1,6} |\\*\\*|__|`)");
    std::string result = std::regex_replace(text, thinkRegex, "");
    result = std::regex_replace(result, markdownRegex, "");
    return collapseSpaces(result);
}

Llm::Llm(const std::string& modelPath, const std::string& mmprojPath, int numWorkers) {
    llama_log_set(filtered_llama_log, nullptr);
    ggml_backend_load_all();

    {
        std::lock_guard<std::mutex> lock(model_mutex_);
        if (!shared_model_ || current_model_path_ != modelPath) {
            LOG_INFO("Loading model: " + modelPath);

            llama_model_params model_params = llama_model_default_params();
            model_params.n_gpu_layers = env_int("AUCTV_GPU_LAYERS", 0);

            llama_model* model = llama_model_load_from_file(modelPath.c_str(), model_params);
            if (!model) {
                LOG_ERROR("Failed to load model: " + modelPath);
                throw std::runtime_error("Failed to load model: " + modelPath);
            }
            shared_model_ = std::shared_ptr<llama_model>(model, llama_model_free);
            current_model_path_ = modelPath;
            LOG_INFO("Model loaded");
        }
    }

    if (!mmprojPath.empty()) {
        mtmd_context_params mparams = mtmd_context_params_default();
        mparams.use_gpu = env_int("AUCTV_GPU_LAYERS", 0) > 0;
        int total_threads = static_cast<int>(std::thread::hardware_concurrency());
        mparams.n_threads = std::max(1, total_threads / std::max(1, numWorkers));
        mparams.verbosity = GGML_LOG_LEVEL_ERROR;

        mtmd_context* ctx = mtmd_init_from_file(mmprojPath.c_str(), shared_model_.get(), mparams);
        if (!ctx) {
            LOG_WARN("Failed to load mmproj: " + mmprojPath + " - document pages will not be readable");
        } else {
            mtmd_owned_ = std::shared_ptr<mtmd_context>(ctx, mtmd_free);
            mtmd_ctx_ = ctx;
            LOG_DEBUG("Vision projector loaded (" + std::to_string(mparams.n_threads) + " threads)");
        }
    }
}

Llm::~Llm() = default;

Llm::SamplingConfig Llm::buildSamplingConfig() const {
    SamplingConfig config;
    const int n_ctx_train = llama_model_n_ctx_train(shared_model_.get());

    config.temp = env_float("AUCTV_TEMP", 0.7f);
    config.top_k = env_int("AUCTV_TOP_K", 40);
    config.top_p = env_float("AUCTV_TOP_P", 0.9f);
    config.min_p = env_float("AUCTV_MIN_P", 0.05f);
    config.repeat_penalty = env_float("AUCTV_REPEAT_PENALTY", 1.1f);
    config.repeat_last_n = env_int("AUCTV_REPEAT_LAST_N", 64);
    config.seed = static_cast<uint32_t>(env_int("AUCTV_SEED", 0));

    config.max_ctx = std::min(n_ctx_train, env_int("AUCTV_MAX_CTX", 8192));
    // Scene narration is a few sentences
    config.n_predict = env_int("AUCTV_PREDICT", 512);
    return config;
}

void Llm::buildContextParams(int n_prompt, const SamplingConfig& config, llama_context_params& params) const {
    params = llama_context_default_params();
    params.n_ctx = std::min(n_prompt + config.n_predict + 64, config.max_ctx);
    params.n_batch = env_int("AUCTV_BATCH", 2048);
    params.no_perf = true;
}

llama_sampler* Llm::buildSampler(const SamplingConfig& config) const {
    auto sparams = llama_sampler_chain_default_params();
    sparams.no_perf = true;
    llama_sampler* smpl = llama_sampler_chain_init(sparams);

    llama_sampler_chain_add(smpl, llama_sampler_init_penalties(
        config.repeat_last_n, config.repeat_penalty, 0.0f, 0.0f));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_k(config.top_k));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_p(config.top_p, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_min_p(config.min_p, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_temp(config.temp));
    llama_sampler_chain_add(smpl, llama_sampler_init_dist(config.seed));
    return smpl;
}

std::string Llm::applyTemplate(const std::string& content) const {
    // Base models without a chat template get the raw prompt
    const char* tmpl = llama_model_chat_template(shared_model_.get(), nullptr);
    if (!tmpl) {
        return content;
    }
    llama_chat_message msg = {"user", content.c_str()};
    int len = llama_chat_apply_template(tmpl, &msg, 1, true, nullptr, 0);
    if (len < 0) {
        return content;
    }
    std::vector<char> buf(static_cast<std::size_t>(len) + 1);
    int res = llama_chat_apply_template(tmpl, &msg, 1, true, buf.data(), static_cast<int32_t>(buf.size()));
    return res > 0 ? std::string(buf.data(), static_cast<std::size_t>(res)) : content;
}

LlmResult Llm::generate(const std::string& prompt, const Deadline& deadline) {
    if (!shared_model_) {
        return {false, "", "Model not loaded"};
    }
    if (deadline.stop()) {
        return stopped(deadline);
    }

    try {
        SamplingConfig config = buildSamplingConfig();
        const std::string formatted = applyTemplate(prompt);
        const llama_vocab* vocab = llama_model_get_vocab(shared_model_.get());

        const int n_prompt = -llama_tokenize(vocab, formatted.c_str(), static_cast<int32_t>(formatted.size()),
                                             nullptr, 0, true, true);
        if (n_prompt <= 0) {
            return {false, "", "Failed to tokenize prompt"};
        }
        config.n_predict = std::min(config.n_predict, std::max(0, config.max_ctx - n_prompt - 64));

        std::vector<llama_token> tokens(static_cast<std::size_t>(n_prompt));
        if (llama_tokenize(vocab, formatted.c_str(), static_cast<int32_t>(formatted.size()),
                           tokens.data(), static_cast<int32_t>(tokens.size()), true, true) < 0) {
            return {false, "", "Failed to tokenize prompt"};
        }

        llama_context_params ctx_params;
        buildContextParams(n_prompt, config, ctx_params);
        ContextPtr ctx(llama_init_from_model(shared_model_.get(), ctx_params));
        if (!ctx) {
            return {false, "", "Failed to create context"};
        }
        SamplerPtr smpl(buildSampler(config));

        if (llama_decode(ctx.get(), llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size())))) {
            return {false, "", "Failed to decode prompt"};
        }

        LlmResult result = sampleLoop(ctx.get(), smpl.get(), vocab, config.n_predict, deadline,
            [&ctx](llama_token token) {
                return llama_decode(ctx.get(), llama_batch_get_one(&token, 1)) == 0;
            });
        if (result.ok) {
            LOG_DEBUG("Generated " + std::to_string(result.output.size()) + " bytes");
            result.output = cleanForSpeech(result.output);
        }
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Inference error: " + std::string(e.what()));
        return {false, "", "Inference error: " + std::string(e.what())};
    }
}

LlmResult Llm::describe(const std::string& prompt, const std::filesystem::path& image, const Deadline& deadline) {
    if (!shared_model_) {
        return {false, "", "Model not loaded"};
    }
    if (!mtmd_ctx_) {
        return {false, "", "Vision projector not loaded"};
    }
    if (deadline.stop()) {
        return stopped(deadline);
    }

    try {
        SamplingConfig config = buildSamplingConfig();
        config.temp = env_float("AUCTV_VISION_TEMP", 0.3f);

        std::string content = prompt;
        if (content.find(mtmd_default_marker()) == std::string::npos) {
            content = std::string(mtmd_default_marker()) + content;
        }
        const std::string formatted = applyTemplate(content);

        std::unique_ptr<mtmd_bitmap, BitmapDeleter> bitmap(
            mtmd_helper_bitmap_init_from_file(mtmd_ctx_, image.c_str()));
        if (!bitmap) {
            return {false, "", "Failed to load page image"};
        }
        std::unique_ptr<mtmd_input_chunks, ChunksDeleter> chunks(mtmd_input_chunks_init());
        if (!chunks) {
            return {false, "", "Failed to init image chunks"};
        }

        mtmd_input_text text;
        text.text = formatted.c_str();
        text.add_special = true;
        text.parse_special = true;
        const mtmd_bitmap* bitmaps[] = {bitmap.get()};
        if (mtmd_tokenize(mtmd_ctx_, chunks.get(), &text, bitmaps, 1) != 0) {
            return {false, "", "Failed to tokenize multimodal prompt"};
        }

        const int n_prompt = static_cast<int>(mtmd_helper_get_n_tokens(chunks.get()));
        config.n_predict = std::min(config.n_predict, std::max(0, config.max_ctx - n_prompt - 64));

        llama_context_params ctx_params;
        buildContextParams(n_prompt, config, ctx_params);
        ContextPtr ctx(llama_init_from_model(shared_model_.get(), ctx_params));
        if (!ctx) {
            return {false, "", "Failed to create context"};
        }
        SamplerPtr smpl(buildSampler(config));

        llama_pos n_past = 0;
        {
            std::lock_guard<std::mutex> vision_lock(vision_encoding_mutex_);
            if (deadline.stop()) {
                return stopped(deadline);
            }
            if (mtmd_helper_eval_chunks(mtmd_ctx_, ctx.get(), chunks.get(), 0, 0,
                                        ctx_params.n_batch, true, &n_past) != 0) {
                return {false, "", "Failed to eval multimodal prompt"};
            }
        }

        const llama_vocab* vocab = llama_model_get_vocab(shared_model_.get());
        llama_batch batch = llama_batch_init(1, 0, 1);
        LlmResult result = sampleLoop(ctx.get(), smpl.get(), vocab, config.n_predict, deadline,
            [&](llama_token token) {
                batch.n_tokens = 1;
                batch.token[0] = token;
                batch.pos[0] = n_past++;
                batch.n_seq_id[0] = 1;
                batch.seq_id[0][0] = 0;
                batch.logits[0] = true;
                return llama_decode(ctx.get(), batch) == 0;
            });
        llama_batch_free(batch);

        if (result.ok) {
            result.output = cleanForSpeech(result.output);
        }
        return result;
    } catch (const std::exception& e) {
        LOG_ERROR("Multimodal inference error: " + std::string(e.what()));
        return {false, "", "Multimodal inference error: " + std::string(e.what())};
    }
}

}
