// agentflow/common/utils/yaml_json.h
#ifndef AGENTFLOW_COMMON_UTILS_YAML_JSON_H
#define AGENTFLOW_COMMON_UTILS_YAML_JSON_H

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

namespace agentflow {

// 将 YAML::Node 转换为 nlohmann::json
nlohmann::json yaml_to_json(const YAML::Node& node);

} // namespace agentflow

#endif // AGENTFLOW_COMMON_UTILS_YAML_JSON_H
