#pragma once

#include <functional>
#include <string>
#include <string_view>

namespace chatpool::util {

enum class LogLevel {
    trace,
    debug,
    info,
    warn,
    error
};

// Receives every line that passes the level threshold, already formatted.
using LogSink = std::function<void(LogLevel, const std::string& line)>;

void initLogging(LogLevel level);
LogLevel logLevel();
void log(LogLevel level, const std::string& message);

// Replaces the std::clog writer; an empty sink restores it.
void setLogSink(LogSink sink);

const char* toString(LogLevel level);

// Unknown names fall back to info.
LogLevel parseLogLevel(std::string_view name);

} // namespace chatpool::util
