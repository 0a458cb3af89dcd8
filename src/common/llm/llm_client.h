// common/llm/llm_client.h
#ifndef AGENTFLOW_COMMON_LLM_LLM_CLIENT_H
#define AGENTFLOW_COMMON_LLM_LLM_CLIENT_H

#include "common/tools/registry.h"
#include "core/types/budget.h"
#include "core/types/config.h"
#include "core/types/context.h"
#include <string>
#include <vector>

namespace agentflow {

struct ToolCall {
    std::string id;
    std::string name;
    Value arguments = Value::object();
};

struct ChatMessage {
    std::string role;                  // "system" | "user" | "assistant" | "tool"
    std::string content;
    std::vector<ToolCall> tool_calls;  // assistant turns only
    std::string tool_call_id;          // tool turns only
    std::string name;                  // tool turns only
};

struct TokenUsage {
    int input_tokens = 0;
    int output_tokens = 0;
};

struct LlmRequest {
    NodeId node_id;
    LlmConfig settings;                // node override already merged over global
    std::vector<ChatMessage> messages;
    const ExecutionBudget* budget = nullptr; // cancellation source, may be null
};

struct LlmResponse {
    std::string content;
    std::vector<ToolCall> tool_calls;  // empty when the model is done with tools
    TokenUsage usage;
};

struct StructuredResponse {
    Value raw;                         // unvalidated structured output
    TokenUsage usage;
};

// Provider retry/backoff belongs to the implementation; failures surface as LlmError.
class LlmClient {
public:
    virtual ~LlmClient() = default;

    virtual LlmResponse invoke_with_tools(const LlmRequest& request,
                                          const std::vector<ToolSpec>& tools) = 0;

    virtual StructuredResponse invoke_structured(const LlmRequest& request,
                                                 const Value& output_schema) = 0;
};

} // namespace agentflow

#endif // AGENTFLOW_COMMON_LLM_LLM_CLIENT_H
