// common/llm/cost_estimator.cpp
#include "common/llm/cost_estimator.h"
#include "common/utils/log.h"
#include <cmath>

namespace agentflow {

CostEstimator::CostEstimator() {
    // Google
    table_["gemini-3-pro"] = {0.002, 0.012};
    table_["gemini-3-flash"] = {0.0005, 0.003};
    table_["gemini-2.5-pro"] = {0.00125, 0.010};
    table_["gemini-2.5-flash"] = {0.0003, 0.0025};
    table_["gemini-2.5-flash-lite"] = {0.0001, 0.0004};
    table_["gemini-1.5-pro"] = {0.00125, 0.005};
    table_["gemini-1.5-flash"] = {0.000075, 0.0003};
    table_["gemini-1.5-flash-8b"] = {0.0000375, 0.00015};
    table_["gemini-1.0-pro"] = {0.0005, 0.0015};
    // OpenAI
    table_["gpt-4o"] = {0.0025, 0.010};
    table_["gpt-4o-mini"] = {0.00015, 0.0006};
    table_["gpt-4-turbo"] = {0.010, 0.030};
    table_["gpt-4"] = {0.030, 0.060};
    table_["gpt-3.5-turbo"] = {0.0005, 0.0015};
    // Anthropic
    table_["claude-3-5-sonnet"] = {0.003, 0.015};
    table_["claude-3-5-haiku"] = {0.0008, 0.004};
    table_["claude-3-opus"] = {0.015, 0.075};
    table_["claude-3-haiku"] = {0.00025, 0.00125};
}

void CostEstimator::set_pricing(const std::string& model, ModelPricing pricing) {
    table_[model] = pricing;
}

std::optional<ModelPricing> CostEstimator::pricing(const std::string& model) const {
    auto it = table_.find(model);
    if (it != table_.end()) return it->second;

    const ModelPricing* best = nullptr;
    size_t best_len = 0;
    for (const auto& [name, price] : table_) {
        if (name.size() > best_len && model.compare(0, name.size(), name) == 0) {
            best = &price;
            best_len = name.size();
        }
    }
    if (best) return *best;
    return std::nullopt;
}

double CostEstimator::estimate_cost(const std::string& model, int input_tokens, int output_tokens) const {
    auto price = pricing(model);
    if (!price) {
        log_debug("no pricing for model '" + model + "', cost recorded as 0");
        return 0.0;
    }
    double cost = (input_tokens / 1000.0) * price->input_per_1k +
                  (output_tokens / 1000.0) * price->output_per_1k;
    return std::round(cost * 1e6) / 1e6;
}

} // namespace agentflow
