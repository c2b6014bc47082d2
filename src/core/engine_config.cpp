// src/core/engine_config.cpp
#include "agentflow/core/engine_config.h"
#include "agentflow/common/utils/yaml_json.h"
#include "agentflow/core/context_store.h"
#include "agentflow/core/types/errors.h"
#include <filesystem>
#include <fstream>
#include <yaml-cpp/yaml.h>

namespace agentflow {

std::string_view to_string(InputMode mode) {
    switch (mode) {
        case InputMode::ORIGINAL: return "original";
        case InputMode::CHAINED:  return "chained";
    }
    return "original";
}

EngineConfig EngineConfig::from_json(const Value& j) {
    EngineConfig config;
    if (j.is_null()) {
        return config;
    }
    if (!j.is_object()) {
        throw ConfigError("Engine config must be an object, got: " + j.dump());
    }

    if (j.contains("input_mode")) {
        const auto& mode = j["input_mode"];
        if (!mode.is_string()) {
            throw ConfigError("input_mode must be a string");
        }
        const auto text = mode.get<std::string>();
        if (text == "original") {
            config.input_mode = InputMode::ORIGINAL;
        } else if (text == "chained") {
            config.input_mode = InputMode::CHAINED;
        } else {
            throw ConfigError("Unknown input_mode: " + text);
        }
    }

    if (j.contains("log_level")) {
        const auto& lvl = j["log_level"];
        if (!lvl.is_string()) {
            throw ConfigError("log_level must be a string");
        }
        auto parsed = log::parse_level(lvl.get<std::string>());
        if (!parsed) {
            throw ConfigError("Unknown log_level: " + lvl.get<std::string>());
        }
        config.log_level = *parsed;
    }

    if (j.contains("flow_params")) {
        const auto& params = j["flow_params"];
        if (!params.is_null() && !params.is_object()) {
            throw ConfigError("flow_params must be an object");
        }
        if (params.is_object()) {
            config.flow_params = params;
        }
    }

    if (j.contains("warn_on_implicit_default")) {
        const auto& warn = j["warn_on_implicit_default"];
        if (!warn.is_boolean()) {
            throw ConfigError("warn_on_implicit_default must be a boolean");
        }
        config.warn_on_implicit_default = warn.get<bool>();
    }

    return config;
}

EngineConfig EngineConfig::from_file(const std::string& path) {
    namespace fs = std::filesystem;

    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path);
    }

    const auto ext = fs::path(path).extension().string();
    Value j;
    try {
        if (ext == ".yaml" || ext == ".yml") {
            j = yaml_to_json(YAML::Load(file));
        } else {
            file >> j;
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse YAML config '" + path + "': " + e.what());
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError("Failed to parse JSON config '" + path + "': " + e.what());
    }
    return from_json(j);
}

void EngineConfig::apply(ContextStore& context) const {
    // 配置中的 flow_params 作为默认值，context 中已有的键优先
    Params params = flow_params;
    merge_params(params, context.get_flow_params());
    context.set_flow_params(std::move(params));
    log::set_level(log_level);
}

Value EngineConfig::to_json() const {
    Value j;
    j["input_mode"] = std::string(to_string(input_mode));
    j["log_level"] = std::string(log::to_string(log_level));
    j["flow_params"] = flow_params;
    j["warn_on_implicit_default"] = warn_on_implicit_default;
    return j;
}

} // namespace agentflow
