#include "troupe/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace troupe::log {

namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_write_mutex;

}  // namespace

void set_level(Level level) {
    g_level.store(level, std::memory_order_relaxed);
}

Level level() {
    return g_level.load(std::memory_order_relaxed);
}

const char* level_string(Level level) {
    switch (level) {
        case Level::Trace: return "TRACE";
        case Level::Debug: return "DEBUG";
        case Level::Info: return "INFO";
        case Level::Warn: return "WARN";
        case Level::Error: return "ERROR";
        case Level::Off: return "OFF";
        default: return "UNKNOWN";
    }
}

std::optional<Level> parse_level(std::string_view text) {
    if (text == "trace") return Level::Trace;
    if (text == "debug") return Level::Debug;
    if (text == "info") return Level::Info;
    if (text == "warn" || text == "warning") return Level::Warn;
    if (text == "error") return Level::Error;
    if (text == "off") return Level::Off;
    return std::nullopt;
}

void write(Level level, std::string_view component, const std::string& message) {
    std::lock_guard lock(g_write_mutex);
    std::cerr << "[troupe] [" << level_string(level) << "] [" << component << "] "
              << message << "\n";
}

}  // namespace troupe::log
