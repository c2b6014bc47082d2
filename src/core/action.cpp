// src/core/action.cpp
#include "agentflow/core/types/action.h"
#include <stdexcept>

namespace agentflow {

Action Action::parse(std::string_view label) {
    Action action;
    action.label = std::string(label);
    if (label == kDefaultAction) {
        action.kind = ActionKind::DEFAULT;
    } else if (label == kSuccessAction) {
        action.kind = ActionKind::SUCCESS;
    } else if (label == kFailureAction) {
        action.kind = ActionKind::FAILURE;
    } else {
        action.kind = ActionKind::CUSTOM;
    }
    return action;
}

Action Action::from_kind(ActionKind kind) {
    if (kind == ActionKind::CUSTOM) {
        throw std::invalid_argument("Custom actions must be created from a label");
    }
    return parse(to_string(kind));
}

std::string_view to_string(ActionKind kind) {
    switch (kind) {
        case ActionKind::DEFAULT: return kDefaultAction;
        case ActionKind::SUCCESS: return kSuccessAction;
        case ActionKind::FAILURE: return kFailureAction;
        case ActionKind::CUSTOM:  return "custom";
    }
    return "custom";
}

bool has_explicit_action(const Value& metadata) {
    return metadata.is_object() && metadata.contains(kActionKey);
}

Action action_from_metadata(const Value& metadata) {
    if (!has_explicit_action(metadata)) {
        return Action{};
    }
    const auto& value = metadata.at(kActionKey);
    if (value.is_string()) {
        return Action::parse(value.get<std::string>());
    }
    return Action::parse(value.dump()); // 非字符串按 JSON 文本作为路由键
}

} // namespace agentflow
