/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "tessera/runner.hpp"
#include "tessera/env.hpp"
#include "tessera/logger.hpp"
#include "llama.h"
#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <vector>

namespace tessera {

namespace {

using ContextPtr = std::unique_ptr<llama_context, decltype(&llama_free)>;
using SamplerPtr = std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)>;

// Room left for the chat template's closing tokens.
constexpr int kContextReserve = 64;

// Keep llama.cpp chatter off the console unless LLAMA_LOG_LEVEL asks for it
void filtered_llama_log(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    if (!text || text[0] == '.' || text[0] == '\n' || text[0] == '\0') {
        return;
    }

    static int filter_level = -1;

    if (filter_level == -1) {
        const std::string env = envString("LLAMA_LOG_LEVEL");
        filter_level = env == "info" ? GGML_LOG_LEVEL_INFO :
                       env == "warn" ? GGML_LOG_LEVEL_WARN :
                       env == "debug" ? GGML_LOG_LEVEL_DEBUG :
                       GGML_LOG_LEVEL_ERROR;
    }

    if (level >= filter_level) {
        std::fprintf(stderr, "%s", text);
    }
}

bool appendPiece(const llama_vocab* vocab, llama_token token, std::string& out) {
    char buf[128];
    int n = llama_token_to_piece(vocab, token, buf, sizeof(buf), 0, true);
    if (n >= 0) {
        out.append(buf, static_cast<std::size_t>(n));
        return true;
    }
    // A negative count is the size the piece actually needs.
    std::vector<char> large(static_cast<std::size_t>(-n));
    n = llama_token_to_piece(vocab, token, large.data(), static_cast<int32_t>(large.size()), 0, true);
    if (n < 0) {
        return false;
    }
    out.append(large.data(), static_cast<std::size_t>(n));
    return true;
}

}

RunnerConfig RunnerConfig::fromEnv() {
    RunnerConfig config;
#if defined(__APPLE__)
    config.gpuLayers = envInt("TESSERA_GPU_LAYERS", 99);
#else
    config.gpuLayers = envInt("TESSERA_GPU_LAYERS", 0);
#endif
    config.maxContext = envInt("TESSERA_MAX_CTX", config.maxContext);
    config.maxPredict = envInt("TESSERA_PREDICT", config.maxPredict);
    config.batch = envInt("TESSERA_BATCH", config.batch);
    config.temperature = envFloat("TESSERA_TEMP", config.temperature);
    config.topK = envInt("TESSERA_TOP_K", config.topK);
    config.topP = envFloat("TESSERA_TOP_P", config.topP);
    config.minP = envFloat("TESSERA_MIN_P", config.minP);
    config.repeatPenalty = envFloat("TESSERA_REPEAT_PENALTY", config.repeatPenalty);
    config.repeatLastN = envInt("TESSERA_REPEAT_LAST_N", config.repeatLastN);
    config.seed = static_cast<uint32_t>(envInt("TESSERA_SEED", 0));
    return config;
}

Runner::Runner(const std::string& modelPath, const RunnerConfig& config)
    : modelPath_(modelPath), config_(config) {
    llama_log_set(filtered_llama_log, nullptr);
    ggml_backend_load_all();

    LOG_INFO("Loading model: " + modelPath);

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = config_.gpuLayers;

    llama_model* model = llama_model_load_from_file(modelPath.c_str(), model_params);
    if (!model) {
        LOG_ERROR("Failed to load model: " + modelPath);
        throw std::runtime_error("Failed to load model: " + modelPath);
    }
    model_ = std::shared_ptr<llama_model>(model, llama_model_free);

    const int n_ctx_train = llama_model_n_ctx_train(model);
    contextLimit_ = n_ctx_train > 0 ? std::min(n_ctx_train, config_.maxContext) : config_.maxContext;

    LOG_INFO("Model loaded, context limit " + std::to_string(contextLimit_) + " tokens");
    LOG_DEBUG("Sampling: temp=" + std::to_string(config_.temperature) +
              " top_k=" + std::to_string(config_.topK) +
              " top_p=" + std::to_string(config_.topP) +
              " n_predict=" + std::to_string(config_.maxPredict));
}

Runner::~Runner() = default;

llama_sampler* Runner::buildSampler() const {
    auto sparams = llama_sampler_chain_default_params();
    sparams.no_perf = true;
    llama_sampler* smpl = llama_sampler_chain_init(sparams);

    llama_sampler_chain_add(smpl, llama_sampler_init_penalties(
        config_.repeatLastN,
        config_.repeatPenalty,
        0.0f,
        0.0f
    ));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_k(config_.topK));
    llama_sampler_chain_add(smpl, llama_sampler_init_top_p(config_.topP, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_min_p(config_.minP, 1));
    llama_sampler_chain_add(smpl, llama_sampler_init_temp(config_.temperature));
    llama_sampler_chain_add(smpl, llama_sampler_init_dist(config_.seed));

    return smpl;
}

RunResult Runner::run(const std::string& prompt) {
    if (!model_) {
        return {false, "", "Model not loaded"};
    }

    try {
        const std::string formatted = applyChatTemplate(prompt);
        const llama_vocab* vocab = llama_model_get_vocab(model_.get());

        const int n_prompt = -llama_tokenize(vocab, formatted.c_str(), static_cast<int32_t>(formatted.size()),
                                             nullptr, 0, true, true);
        if (n_prompt <= 0) {
            return {false, "", "Failed to tokenize segment"};
        }
        if (n_prompt + kContextReserve >= contextLimit_) {
            return {false, "", "Prompt of " + std::to_string(n_prompt) + " tokens exceeds context of " +
                               std::to_string(contextLimit_)};
        }
        const int n_predict = std::min(config_.maxPredict, contextLimit_ - n_prompt - kContextReserve);

        std::vector<llama_token> tokens(static_cast<std::size_t>(n_prompt));
        if (llama_tokenize(vocab, formatted.c_str(), static_cast<int32_t>(formatted.size()),
                           tokens.data(), n_prompt, true, true) < 0) {
            return {false, "", "Failed to tokenize segment"};
        }

        llama_context_params ctx_params = llama_context_default_params();
        ctx_params.n_ctx = static_cast<uint32_t>(std::min(n_prompt + n_predict + kContextReserve, contextLimit_));
        ctx_params.n_batch = static_cast<uint32_t>(std::max(config_.batch, n_prompt));
        ctx_params.no_perf = true;

        ContextPtr context(llama_init_from_model(model_.get(), ctx_params), llama_free);
        if (!context) {
            return {false, "", "Failed to create context"};
        }
        SamplerPtr sampler(buildSampler(), llama_sampler_free);

        llama_batch batch = llama_batch_get_one(tokens.data(), n_prompt);

        llama_token decoder_start = 0;
        if (llama_model_has_encoder(model_.get())) {
            if (llama_encode(context.get(), batch)) {
                return {false, "", "Failed to encode segment"};
            }
            decoder_start = llama_model_decoder_start_token(model_.get());
            if (decoder_start == LLAMA_TOKEN_NULL) {
                decoder_start = llama_vocab_bos(vocab);
            }
            batch = llama_batch_get_one(&decoder_start, 1);
        }

        std::string output;
        llama_token token = 0;
        int generated = 0;
        bool finished = false;

        while (generated < n_predict) {
            if (llama_decode(context.get(), batch)) {
                return {false, "", "Failed to decode after " + std::to_string(generated) + " tokens"};
            }

            token = llama_sampler_sample(sampler.get(), context.get(), -1);
            llama_sampler_accept(sampler.get(), token);
            if (llama_vocab_is_eog(vocab, token)) {
                finished = true;
                break;
            }
            if (!appendPiece(vocab, token, output)) {
                return {false, "", "Failed to convert token to text"};
            }
            ++generated;
            batch = llama_batch_get_one(&token, 1);
        }

        if (!finished) {
            LOG_WARN("Generation stopped at the " + std::to_string(n_predict) + " token limit; output may be cut short");
        }
        LOG_DEBUG("Generated " + std::to_string(generated) + " tokens (" + std::to_string(output.size()) + " bytes)");
        return {true, stripThinkBlocks(output), ""};

    } catch (const std::exception& e) {
        LOG_ERROR("Inference error: " + std::string(e.what()));
        return {false, "", "Inference error: " + std::string(e.what())};
    }
}

std::string Runner::applyChatTemplate(const std::string& content) const {
    // Base models have no template and take the prompt as is.
    const char* tmpl = llama_model_chat_template(model_.get(), nullptr);
    if (!tmpl) {
        return content;
    }

    llama_chat_message msg = {"user", content.c_str()};
    int len = llama_chat_apply_template(tmpl, &msg, 1, true, nullptr, 0);
    if (len < 0) {
        LOG_DEBUG("Chat template could not be applied, sending raw prompt");
        return content;
    }

    std::vector<char> buf(static_cast<std::size_t>(len) + 1);
    int res = llama_chat_apply_template(tmpl, &msg, 1, true, buf.data(), static_cast<int32_t>(buf.size()));
    return (res > 0) ? std::string(buf.data(), static_cast<std::size_t>(res)) : content;
}

}
