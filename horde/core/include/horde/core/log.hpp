#pragma once

#include <string>

namespace horde::core {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Receives every message that passes the level filter.
// Called on whichever thread logged, under the logger's lock.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void log(LogLevel level, const std::string& message) = 0;
};

void log(LogLevel level, const char* message);
void log(LogLevel level, const std::string& message);

// Messages below this level are dropped (default Info)
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Console echo on stdout/stderr, on by default. Sinks are unaffected.
void set_log_console(bool enabled);

const char* to_string(LogLevel level);

void add_log_sink(ILogSink* sink);
void remove_log_sink(ILogSink* sink);

} // namespace horde::core
