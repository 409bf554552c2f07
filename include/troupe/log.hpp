#pragma once

#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace troupe::log {

enum class Level {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

// Process-wide threshold
void set_level(Level level);
Level level();

inline bool enabled(Level l) { return l >= level() && l != Level::Off; }

const char* level_string(Level level);
std::optional<Level> parse_level(std::string_view text);

// Emit one line to stderr: "[troupe] [LEVEL] [component] message"
void write(Level level, std::string_view component, const std::string& message);

}  // namespace troupe::log

// Streaming log macros; the expression is only evaluated when enabled
#define TROUPE_LOG(lvl, component, expr)                                   \
    do {                                                                   \
        if (::troupe::log::enabled(lvl)) {                                 \
            std::ostringstream troupe_log_stream_;                         \
            troupe_log_stream_ << expr;                                    \
            ::troupe::log::write(lvl, component, troupe_log_stream_.str()); \
        }                                                                  \
    } while (0)

#define TROUPE_LOG_TRACE(component, expr) TROUPE_LOG(::troupe::log::Level::Trace, component, expr)
#define TROUPE_LOG_DEBUG(component, expr) TROUPE_LOG(::troupe::log::Level::Debug, component, expr)
#define TROUPE_LOG_INFO(component, expr) TROUPE_LOG(::troupe::log::Level::Info, component, expr)
#define TROUPE_LOG_WARN(component, expr) TROUPE_LOG(::troupe::log::Level::Warn, component, expr)
#define TROUPE_LOG_ERROR(component, expr) TROUPE_LOG(::troupe::log::Level::Error, component, expr)
