// agentflow/core/types/action.h
#ifndef AGENTFLOW_CORE_TYPES_ACTION_H
#define AGENTFLOW_CORE_TYPES_ACTION_H

#include "agentflow/core/types/context.h"
#include <cstdint>
#include <string>
#include <string_view>

namespace agentflow {

inline constexpr char kDefaultAction[] = "default";
inline constexpr char kSuccessAction[] = "success";
inline constexpr char kFailureAction[] = "failure";
inline constexpr char kActionKey[] = "action"; // metadata 中的路由键

// 已知动作 + 开放的字符串扩展
enum class ActionKind : uint8_t {
    DEFAULT,
    SUCCESS,
    FAILURE,
    CUSTOM
};

struct Action {
    ActionKind kind = ActionKind::DEFAULT;
    std::string label{kDefaultAction};

    static Action parse(std::string_view label);
    static Action from_kind(ActionKind kind); // CUSTOM is rejected (no label)

    bool operator==(const Action& other) const { return label == other.label; }
};

std::string_view to_string(ActionKind kind);

// Routing key of a node output: metadata["action"] verbatim, else "default".
// A non-string value is converted to its JSON text.
Action action_from_metadata(const Value& metadata);

// True when metadata carries an explicit "action" entry.
bool has_explicit_action(const Value& metadata);

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_ACTION_H
