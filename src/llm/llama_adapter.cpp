// src/llm/llama_adapter.cpp
#include "agentorch/llm/llama_adapter.h"
#include "agentorch/common/errors.h"
#include <spdlog/spdlog.h>

namespace agentorch {

LlamaAdapter::LlamaAdapter(const Config& config)
    : config_(config),
      model_(nullptr, llama_model_free),
      ctx_(nullptr, llama_free),
      sampler_(nullptr, llama_sampler_free) {

    llama_model_params model_params = llama_model_default_params();
    model_params.n_gpu_layers = 99; // Use all GPU layers if available

    llama_model* raw_model = llama_model_load_from_file(config_.model_path.c_str(), model_params);
    if (!raw_model) {
        throw CollaboratorError("Failed to load model: " + config_.model_path);
    }
    model_.reset(raw_model);

    llama_context_params ctx_params = llama_context_default_params();
    ctx_params.n_ctx = config_.n_ctx;
    ctx_params.n_threads = config_.n_threads;
    ctx_params.n_threads_batch = config_.n_threads;

    llama_context* raw_ctx = llama_init_from_model(model_.get(), ctx_params);
    if (!raw_ctx) {
        throw CollaboratorError("Failed to create llama context for model: " + config_.model_path);
    }
    ctx_.reset(raw_ctx);

    auto smpl_params = llama_sampler_chain_default_params();
    llama_sampler* raw_sampler = llama_sampler_chain_init(smpl_params);
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_min_p(config_.min_p, 1));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_temp(config_.temperature));
    llama_sampler_chain_add(raw_sampler, llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    sampler_.reset(raw_sampler);

    spdlog::info("Loaded model {} (n_ctx={}, n_threads={})", config_.model_path, config_.n_ctx, config_.n_threads);
}

LlamaAdapter::~LlamaAdapter() = default;

std::vector<llama_token> LlamaAdapter::tokenize(const std::string& text, bool add_bos) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    // 第一次调用返回所需 token 数（负数）
    int32_t n_tokens = -llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                                       nullptr, 0, add_bos, true);
    if (n_tokens <= 0) return {};

    std::vector<llama_token> tokens(n_tokens);
    if (llama_tokenize(vocab, text.data(), static_cast<int32_t>(text.size()),
                       tokens.data(), n_tokens, add_bos, true) < 0) {
        return {};
    }
    return tokens;
}

std::string LlamaAdapter::detokenize(llama_token token) {
    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    char buf[256] = {0};
    int n = llama_token_to_piece(vocab, token, buf, sizeof(buf) - 1, 0, true);
    if (n < 0) return "";
    return std::string(buf, n);
}

std::string LlamaAdapter::complete(const std::string& prompt) {
    std::lock_guard<std::mutex> lock(generate_mutex_);
    if (!is_available()) {
        throw CollaboratorError("Model not loaded");
    }

    // Each completion is independent; start from an empty KV cache.
    llama_memory_clear(llama_get_memory(ctx_.get()), true);

    auto tokens = tokenize(prompt, true);
    if (tokens.empty()) {
        throw CollaboratorError("Tokenization failed");
    }

    llama_batch batch = llama_batch_get_one(tokens.data(), static_cast<int32_t>(tokens.size()));
    if (llama_decode(ctx_.get(), batch)) {
        throw CollaboratorError("Prompt evaluation failed");
    }

    std::string response;
    for (int i = 0; i < config_.n_predict; ++i) {
        llama_token new_token = llama_sampler_sample(sampler_.get(), ctx_.get(), -1);

        if (llama_vocab_is_eog(llama_model_get_vocab(model_.get()), new_token)) {
            break;
        }

        response += detokenize(new_token);

        batch = llama_batch_get_one(&new_token, 1);
        if (llama_decode(ctx_.get(), batch)) {
            spdlog::warn("llama_decode failed after {} generated tokens, returning partial completion", i + 1);
            break;
        }
    }

    llama_sampler_reset(sampler_.get());
    return response;
}

bool LlamaAdapter::is_available() const {
    return model_ != nullptr && ctx_ != nullptr && sampler_ != nullptr;
}

} // namespace agentorch
