// agentflow/core/types/errors.h
#ifndef AGENTFLOW_CORE_TYPES_ERRORS_H
#define AGENTFLOW_CORE_TYPES_ERRORS_H

#include <stdexcept>
#include <string>

namespace agentflow {

// 流程无法运行（例如没有 start 节点）
struct FlowError : public std::runtime_error {
    explicit FlowError(const std::string& msg) : std::runtime_error(msg) {}
};

// 图构建 API 使用错误
struct GraphError : public std::invalid_argument {
    explicit GraphError(const std::string& msg) : std::invalid_argument(msg) {}
};

// 配置文件 / 配置值错误
struct ConfigError : public std::runtime_error {
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace agentflow

#endif // AGENTFLOW_CORE_TYPES_ERRORS_H
