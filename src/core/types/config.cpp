// core/types/config.cpp
#include "core/types/config.h"

namespace agentflow {

const StateFieldConfig* StateSchema::find(const std::string& name) const {
    for (const auto& f : fields) {
        if (f.name == name) return &f;
    }
    return nullptr;
}

LlmConfig LlmConfig::merged_over(const LlmConfig& base) const {
    LlmConfig merged = base;
    if (provider) merged.provider = provider;
    if (model) merged.model = model;
    if (temperature) merged.temperature = temperature;
    if (max_tokens) merged.max_tokens = max_tokens;
    if (api_base) merged.api_base = api_base;
    return merged;
}

Value LlmConfig::to_json() const {
    Value j = Value::object();
    if (provider) j["provider"] = *provider;
    if (model) j["model"] = *model;
    if (temperature) j["temperature"] = *temperature;
    if (max_tokens) j["max_tokens"] = *max_tokens;
    if (api_base) j["api_base"] = *api_base;
    return j;
}

EdgeKind EdgeConfig::kind() const {
    if (loop) return EdgeKind::LOOP;
    if (!routes.empty()) return EdgeKind::CONDITIONAL;
    if (to_is_list) return EdgeKind::FORK_JOIN;
    return EdgeKind::LINEAR;
}

const NodeConfig* WorkflowConfig::find_node(const NodeId& id) const {
    for (const auto& n : nodes) {
        if (n.id == id) return &n;
    }
    return nullptr;
}

std::string to_string(EdgeKind kind) {
    switch (kind) {
        case EdgeKind::LINEAR: return "linear";
        case EdgeKind::CONDITIONAL: return "conditional";
        case EdgeKind::LOOP: return "loop";
        case EdgeKind::FORK_JOIN: return "fork_join";
    }
    return "unknown";
}

std::string to_string(GateAction action) {
    switch (action) {
        case GateAction::WARN: return "warn";
        case GateAction::FAIL: return "fail";
        case GateAction::BLOCK_DEPLOY: return "block_deploy";
    }
    return "unknown";
}

} // namespace agentflow
