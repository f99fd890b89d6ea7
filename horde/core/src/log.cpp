#include <horde/core/log.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <vector>

namespace horde::core {

namespace {

struct Logger {
    std::atomic<LogLevel> level{LogLevel::Info};
    std::atomic<bool> console{true};
    std::mutex mutex;
    std::vector<ILogSink*> sinks;
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();
};

Logger& logger() {
    static Logger instance;
    return instance;
}

} // anonymous namespace

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
    }
    return "?";
}

void log(LogLevel level, const std::string& message) {
    Logger& l = logger();
    if (level < l.level.load()) return;

    std::lock_guard<std::mutex> lock(l.mutex);

    if (l.console.load()) {
        // Seconds since the first log call
        double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - l.start).count();
        std::FILE* stream = level >= LogLevel::Warn ? stderr : stdout;
        std::fprintf(stream, "%9.3f %-5s %s\n", seconds, to_string(level), message.c_str());
    }

    for (ILogSink* sink : l.sinks) {
        sink->log(level, message);
    }
}

void log(LogLevel level, const char* message) {
    log(level, std::string(message ? message : ""));
}

void set_log_level(LogLevel level) {
    logger().level = level;
}

LogLevel get_log_level() {
    return logger().level.load();
}

void set_log_console(bool enabled) {
    logger().console = enabled;
}

void add_log_sink(ILogSink* sink) {
    if (!sink) return;
    Logger& l = logger();
    std::lock_guard<std::mutex> lock(l.mutex);
    if (std::find(l.sinks.begin(), l.sinks.end(), sink) == l.sinks.end()) {
        l.sinks.push_back(sink);
    }
}

void remove_log_sink(ILogSink* sink) {
    Logger& l = logger();
    std::lock_guard<std::mutex> lock(l.mutex);
    l.sinks.erase(std::remove(l.sinks.begin(), l.sinks.end(), sink), l.sinks.end());
}

} // namespace horde::core
