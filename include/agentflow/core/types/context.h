// agentflow/core/types/context.h
#ifndef AGENTFLOW_CORE_TYPES_CONTEXT_H
#define AGENTFLOW_CORE_TYPES_CONTEXT_H

#include <nlohmann/json.hpp>

namespace agentflow {

// 使用 nlohmann::json 作为统一的数据类型
using Value = nlohmann::json;
using Params = nlohmann::json; // 参数包始终是 JSON object

// 将 source 的键覆盖到 target 上（浅合并，source 优先）
inline void merge_params(Params& target, const Params& source) {
    if (!source.is_object() || source.empty()) return;
    if (!target.is_object()) target = Params::object();
    target.update(source);
}

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_CONTEXT_H
