#ifndef AGENTFLOW_COMMON_UTILS_YAML_JSON_H
#define AGENTFLOW_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>
#include <string>

namespace agentflow {

// 将 YAML::Node 转换为 nlohmann::json
// Quoted scalars always stay strings; plain scalars are typed (bool, null, int, float).
nlohmann::json yaml_to_json(const YAML::Node& node);

// Parses YAML (or JSON, which is a YAML subset) text. Throws YAML::Exception.
nlohmann::json parse_yaml_document(const std::string& text);

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_YAML_JSON_H
