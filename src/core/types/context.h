#ifndef AGENTFLOW_TYPES_CONTEXT_H
#define AGENTFLOW_TYPES_CONTEXT_H

#include <nlohmann/json.hpp>
#include <string>

namespace agentflow {

// 使用 nlohmann::json 作为统一的数据类型
using Value = nlohmann::json;

using NodeId = std::string;

inline constexpr const char* START_NODE = "START";
inline constexpr const char* END_NODE = "END";

} // namespace agentflow

#endif // AGENTFLOW_TYPES_CONTEXT_H
