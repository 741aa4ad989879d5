#include "chatpool/util/Logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace chatpool::util {
namespace {

struct LogState {
    std::mutex mutex;
    std::atomic<LogLevel> level{LogLevel::info};
    LogSink sink;
};

LogState& state() {
    static LogState instance;
    return instance;
}

std::string formatLine(LogLevel level, const std::string& message) {
    using namespace std::chrono;

    const auto now = system_clock::now();
    const auto wholeSeconds = floor<seconds>(now);
    const auto millis = duration_cast<milliseconds>(now - wholeSeconds).count();

    const std::time_t t = system_clock::to_time_t(wholeSeconds);
    std::tm tmBuf{};
    localtime_r(&t, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis
        << " [" << toString(level) << "] (" << std::this_thread::get_id() << ") " << message;
    return oss.str();
}

} // namespace

const char* toString(LogLevel level) {
    switch (level) {
    case LogLevel::trace: return "TRACE";
    case LogLevel::debug: return "DEBUG";
    case LogLevel::info:  return "INFO";
    case LogLevel::warn:  return "WARN";
    case LogLevel::error: return "ERROR";
    }
    return "INFO";
}

void initLogging(LogLevel level) {
    state().level = level;
}

LogLevel logLevel() {
    return state().level.load();
}

void setLogSink(LogSink sink) {
    auto& current = state();
    std::scoped_lock lock(current.mutex);
    current.sink = std::move(sink);
}

LogLevel parseLogLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "trace") return LogLevel::trace;
    if (lowered == "debug") return LogLevel::debug;
    if (lowered == "warn" || lowered == "warning") return LogLevel::warn;
    if (lowered == "error") return LogLevel::error;
    return LogLevel::info;
}

void log(LogLevel level, const std::string& message) {
    auto& current = state();
    if (static_cast<int>(level) < static_cast<int>(current.level.load())) {
        return;
    }

    auto line = formatLine(level, message);
    std::scoped_lock lock(current.mutex);
    if (current.sink) {
        current.sink(level, line);
    } else {
        std::clog << line << '\n';
    }
}

} // namespace chatpool::util
