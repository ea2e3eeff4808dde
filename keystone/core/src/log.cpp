#include <keystone/core/log.hpp>
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <mutex>
#include <vector>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace keystone::core {

static std::atomic<LogLevel> s_log_level{LogLevel::Info};
static std::atomic<bool> s_console_output{true};
static std::vector<ILogSink*> s_log_sinks;
static std::mutex s_sink_mutex;

static std::string extract_category(const char* message) {
    if (!message || message[0] != '[') return {};
    const char* end = message + 1;
    while (*end && *end != ']') ++end;
    if (*end != ']') return {};
    return std::string(message + 1, end);
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
    }
    return "UNKNOWN";
}

void log(LogLevel level, const char* message) {
    if (level < s_log_level.load()) return;
    if (!message) return;

    if (s_console_output.load()) {
#ifdef _WIN32
        OutputDebugStringA(message);
        OutputDebugStringA("\n");
#endif
        std::FILE* stream = level >= LogLevel::Error ? stderr : stdout;
        std::fprintf(stream, "%-5s %s\n", log_level_name(level), message);
    }

    // Forward to registered sinks
    std::string category = extract_category(message);
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    for (auto* sink : s_log_sinks) {
        if (sink) {
            sink->log(level, category, message);
        }
    }
}

void set_log_level(LogLevel level) {
    s_log_level = level;
}

LogLevel get_log_level() {
    return s_log_level.load();
}

void add_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.push_back(sink);
}

void remove_log_sink(ILogSink* sink) {
    if (!sink) return;
    std::lock_guard<std::mutex> lock(s_sink_mutex);
    s_log_sinks.erase(
        std::remove(s_log_sinks.begin(), s_log_sinks.end(), sink),
        s_log_sinks.end()
    );
}

void set_console_output(bool enabled) {
    s_console_output = enabled;
}

} // namespace keystone::core
