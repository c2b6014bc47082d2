// src/common/utils/log.cpp
#include "agentflow/common/utils/log.h"
#include <atomic>
#include <iostream>
#include <mutex>

namespace agentflow::log {

namespace {
std::atomic<Level> g_level{Level::Warning};
std::mutex g_write_mutex; // run_async 可能并发写日志
} // namespace

void set_level(Level level) {
    g_level.store(level);
}

Level level() {
    return g_level.load();
}

bool enabled(Level lvl) {
    return lvl != Level::Silent && static_cast<uint8_t>(lvl) >= static_cast<uint8_t>(level());
}

std::string_view to_string(Level lvl) {
    switch (lvl) {
        case Level::Debug:   return "debug";
        case Level::Info:    return "info";
        case Level::Warning: return "warning";
        case Level::Error:   return "error";
        case Level::Silent:  return "silent";
    }
    return "silent";
}

std::optional<Level> parse_level(std::string_view text) {
    if (text == "debug") return Level::Debug;
    if (text == "info") return Level::Info;
    if (text == "warning" || text == "warn") return Level::Warning;
    if (text == "error") return Level::Error;
    if (text == "silent" || text == "off") return Level::Silent;
    return std::nullopt;
}

void write(Level lvl, std::string_view message) {
    if (!enabled(lvl)) {
        return;
    }
    const char* tag = "[INFO]";
    switch (lvl) {
        case Level::Debug:   tag = "[DEBUG]"; break;
        case Level::Info:    tag = "[INFO]"; break;
        case Level::Warning: tag = "[WARNING]"; break;
        case Level::Error:   tag = "[ERROR]"; break;
        case Level::Silent:  return;
    }
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << tag << " " << message << std::endl;
}

} // namespace agentflow::log
