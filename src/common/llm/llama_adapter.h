#ifndef LOOM_LLM_LLAMA_ADAPTER_H
#define LOOM_LLM_LLAMA_ADAPTER_H

#include "common/llm/completion.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <llama.h>

namespace loom {

struct LlmConfig;

class LlamaAdapter : public CompletionProvider {
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
    static Config config_from(const LlmConfig& llm);
    ~LlamaAdapter() override;

    std::string complete(const std::string& prompt, const CompletionConstraints& constraints) override;
    bool is_loaded() const;

private:
    Config config_;
    std::mutex mutex_; // one decode at a time
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
    std::unique_ptr<llama_sampler, decltype(&llama_sampler_free)> sampler_;

    std::vector<llama_token> tokenize(const std::string& text, bool add_bos);
    std::string detokenize(llama_token token);
};

} // namespace loom

#endif // LOOM_LLM_LLAMA_ADAPTER_H
