#pragma once

#include <format>
#include <string>
#include <utility>

namespace keystone::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

const char* log_level_name(LogLevel level);

// Log sink interface for custom log handlers
// Category is the bracketed tag at the start of a message ("[DI] ..." -> "DI"), or empty.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& category, const std::string& message) = 0;
};

void log(LogLevel level, const char* message);
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Formatted logging: log(LogLevel::Info, "[DI] Registered {}", name)
template<typename... Args>
void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
    if (level < get_log_level()) return;
    std::string message = std::format(fmt, std::forward<Args>(args)...);
    log(level, message.c_str());
}

// Register/unregister custom log sinks
void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

// Suppress console output (sinks still receive messages)
void set_console_output(bool enabled);

} // namespace keystone::core
