#ifndef AGENTORCH_LLM_LLAMA_ADAPTER_H
#define AGENTORCH_LLM_LLAMA_ADAPTER_H

#include "agentorch/llm/llm_provider.h"
#include <llama.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agentorch {

class LlamaAdapter : public LlmProvider {
public:
    struct Config {
        std::string model_path;
        int n_ctx = 2048;
        int n_threads = 4;
        float temperature = 0.7f;
        float min_p = 0.05f;
        int n_predict = 512;
    };

    explicit LlamaAdapter(const Config& config);
    ~LlamaAdapter() override;

    std::string complete(const std::string& prompt) override;
    bool is_available() const override;

private:
    Config config_;
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler_;
    std::mutex generate_mutex_; // one llama_context, one decode at a time

    std::vector<llama_token> tokenize(const std::string& text, bool add_bos);
    std::string detokenize(llama_token token);
};

} // namespace agentorch

#endif // AGENTORCH_LLM_LLAMA_ADAPTER_H
