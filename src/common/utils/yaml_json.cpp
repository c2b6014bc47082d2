// src/common/utils/yaml_json.cpp
#include "agentflow/common/utils/yaml_json.h"
#include <string>

namespace agentflow {

namespace {

// 只接受完整解析的数字，"1.2.3"、"12abc" 仍然是字符串
nlohmann::json convert_plain_scalar(const YAML::Node& node) {
    const std::string& s = node.Scalar();

    if (s == "true" || s == "True" || s == "TRUE") return true;
    if (s == "false" || s == "False" || s == "FALSE") return false;
    if (s == "~" || s == "null" || s == "Null" || s == "NULL" || s.empty()) return nullptr;

    long long integer = 0;
    if (YAML::convert<long long>::decode(node, integer)) {
        return integer;
    }
    double number = 0.0;
    if (YAML::convert<double>::decode(node, number)) {
        return number;
    }
    return s;
}

} // namespace

nlohmann::json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Undefined:
        case YAML::NodeType::Null:
            return nullptr;
        case YAML::NodeType::Scalar:
            // 带引号的标量（tag 为 "!"）保持为字符串
            if (node.Tag() == "!") {
                return node.Scalar();
            }
            return convert_plain_scalar(node);
        case YAML::NodeType::Sequence: {
            nlohmann::json arr = nlohmann::json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            nlohmann::json obj = nlohmann::json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
    }
    return nullptr;
}

} // namespace agentflow
