// agentflow/common/utils/log.h
#ifndef AGENTFLOW_COMMON_UTILS_LOG_H
#define AGENTFLOW_COMMON_UTILS_LOG_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace agentflow::log {

enum class Level : uint8_t {
    Debug,
    Info,
    Warning,
    Error,
    Silent
};

void set_level(Level level);
Level level();
bool enabled(Level level);

std::string_view to_string(Level level);
std::optional<Level> parse_level(std::string_view text);

// 输出形如 "[WARNING] msg" 的一行到 std::cerr
void write(Level level, std::string_view message);

inline void debug(std::string_view message) { write(Level::Debug, message); }
inline void info(std::string_view message) { write(Level::Info, message); }
inline void warning(std::string_view message) { write(Level::Warning, message); }
inline void error(std::string_view message) { write(Level::Error, message); }

} // namespace agentflow::log

#endif // AGENTFLOW_COMMON_UTILS_LOG_H
