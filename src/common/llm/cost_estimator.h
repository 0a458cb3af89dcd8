// common/llm/cost_estimator.h
#ifndef AGENTFLOW_COMMON_LLM_COST_ESTIMATOR_H
#define AGENTFLOW_COMMON_LLM_COST_ESTIMATOR_H

#include <optional>
#include <string>
#include <unordered_map>

namespace agentflow {

struct ModelPricing {
    double input_per_1k = 0.0;   // USD per 1K input tokens
    double output_per_1k = 0.0;  // USD per 1K output tokens
};

class CostEstimator {
public:
    CostEstimator(); // 预置 Gemini / OpenAI / Anthropic 价格表

    void set_pricing(const std::string& model, ModelPricing pricing);

    // Exact model name first, then the longest known prefix
    // (so "gpt-4o-2024-08-06" resolves to "gpt-4o").
    std::optional<ModelPricing> pricing(const std::string& model) const;

    // Rounded to micro-dollars; 0 for unknown or local models.
    double estimate_cost(const std::string& model, int input_tokens, int output_tokens) const;

private:
    std::unordered_map<std::string, ModelPricing> table_;
};

} // namespace agentflow

#endif // AGENTFLOW_COMMON_LLM_COST_ESTIMATOR_H
