/*
 * tessera - Resumable Document Segmentation Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <memory>
#include <string>

#include "tessera/generator.hpp"

struct llama_model;
struct llama_sampler;

namespace tessera {

// Sampling and context limits, fixed for the lifetime of a Runner.
struct RunnerConfig {
    int gpuLayers = 0;
    int maxContext = 8192;
    int maxPredict = 2048;
    int batch = 2048;
    float temperature = 0.3f;
    int topK = 40;
    float topP = 0.9f;
    float minP = 0.05f;
    float repeatPenalty = 1.1f;
    int repeatLastN = 64;
    uint32_t seed = 0;

    // TESSERA_GPU_LAYERS, TESSERA_MAX_CTX, TESSERA_PREDICT, TESSERA_BATCH,
    // TESSERA_TEMP, TESSERA_TOP_K, TESSERA_TOP_P, TESSERA_MIN_P,
    // TESSERA_REPEAT_PENALTY, TESSERA_REPEAT_LAST_N, TESSERA_SEED
    [[nodiscard]] static RunnerConfig fromEnv();
};

// Local text generation on a GGUF model through llama.cpp. Each call gets a
// fresh context, so segments never see each other's text.
class Runner final : public Generator {
public:
    // Throws std::runtime_error when the model cannot be loaded.
    Runner(const std::string& modelPath, const RunnerConfig& config);
    ~Runner() override;

    Runner(const Runner&) = delete;
    Runner& operator=(const Runner&) = delete;
    Runner(Runner&&) = delete;
    Runner& operator=(Runner&&) = delete;

    [[nodiscard]] RunResult run(const std::string& prompt) override;
    [[nodiscard]] const std::string& modelPath() const noexcept { return modelPath_; }
    [[nodiscard]] int contextLimit() const noexcept { return contextLimit_; }

private:
    std::string applyChatTemplate(const std::string& content) const;
    llama_sampler* buildSampler() const;

    std::string modelPath_;
    RunnerConfig config_;
    int contextLimit_ = 0;
    std::shared_ptr<llama_model> model_;
};

}
