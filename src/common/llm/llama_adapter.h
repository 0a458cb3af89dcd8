// common/llm/llama_adapter.h
#ifndef AGENTFLOW_COMMON_LLM_LLAMA_ADAPTER_H
#define AGENTFLOW_COMMON_LLM_LLAMA_ADAPTER_H

#include "common/llm/llm_client.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <llama.h>

namespace agentflow {

// Local llama.cpp backend. One model and one context, so calls are serialized;
// every request re-evaluates its full message history.
class LlamaAdapter : public LlmClient {
public:
    struct Config {
        std::string model_path;
        int n_ctx = 2048;
        int n_threads = 4;
        float temperature = 0.7f;
        float min_p = 0.05f;
        int n_predict = 512;
    };

    // Reads llm_config.json; a missing file yields the defaults, model_path is
    // resolved relative to the file. Throws ConfigLoadError on malformed JSON.
    static Config load_config(const std::string& config_path = "llm_config.json");

    // Throws LlmError when the model or context cannot be created.
    explicit LlamaAdapter(const Config& config);
    ~LlamaAdapter() override;

    LlmResponse invoke_with_tools(const LlmRequest& request,
                                  const std::vector<ToolSpec>& tools) override;
    StructuredResponse invoke_structured(const LlmRequest& request,
                                         const Value& output_schema) override;

    bool is_loaded() const;

private:
    struct Generation {
        std::string text;
        TokenUsage usage;
    };

    Generation generate(const std::string& prompt, const LlmRequest& request);
    std::string render_messages(const std::vector<ChatMessage>& messages) const;

    std::vector<llama_token> tokenize(const std::string& text, bool add_bos);
    std::string detokenize(llama_token token);

    Config config_;
    std::mutex mutex_;
    std::unique_ptr<llama_model, decltype(&llama_model_free)> model_;
    std::unique_ptr<llama_context, decltype(&llama_free)> ctx_;
};

// 从模型输出中提取第一个 JSON 对象；找不到时返回 null
Value extract_json_object(const std::string& text);

} // namespace agentflow

#endif // AGENTFLOW_COMMON_LLM_LLAMA_ADAPTER_H
