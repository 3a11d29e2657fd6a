#ifndef AGENTORCH_UTILS_YAML_JSON_H
#define AGENTORCH_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace agentorch {

// 将 YAML::Node 转换为 nlohmann::json
nlohmann::json yaml_to_json(const YAML::Node& node);

} // namespace agentorch

#endif // AGENTORCH_UTILS_YAML_JSON_H
