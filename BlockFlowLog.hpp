// BlockFlowLog.hpp
//
// Tagged, level-filtered logging on top of fmt. Lines look like
// "[WARN][bindings] Unknown variable 'x'" and go to stderr unless a sink is
// installed (the tests install one to capture output).
#pragma once
#include <fmt/core.h>
#include <functional>
#include <string>
#include <utility>

namespace BlockFlow {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

using LogSink = std::function<void(LogLevel, const std::string& tag, const std::string& message)>;

void setLogLevel(LogLevel level);
LogLevel logLevel();
// Parse "debug" | "info" | "warn" | "error" | "off". Returns false on anything else.
bool parseLogLevel(const std::string& text, LogLevel& out);
const char* logLevelName(LogLevel level);

// Replace the output sink; an empty function restores the stderr sink.
void setLogSink(LogSink sink);

inline bool logEnabled(LogLevel level) {
    return level != LogLevel::Off && static_cast<int>(level) >= static_cast<int>(logLevel());
}

void writeLog(LogLevel level, const std::string& tag, const std::string& message);

template <typename... Args>
void log(LogLevel level, const std::string& tag, fmt::format_string<Args...> format, Args&&... args) {
    if (!logEnabled(level)) return;
    writeLog(level, tag, fmt::format(format, std::forward<Args>(args)...));
}

template <typename... Args>
void logDebug(const std::string& tag, fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::Debug, tag, format, std::forward<Args>(args)...);
}

template <typename... Args>
void logInfo(const std::string& tag, fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::Info, tag, format, std::forward<Args>(args)...);
}

template <typename... Args>
void logWarn(const std::string& tag, fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::Warn, tag, format, std::forward<Args>(args)...);
}

template <typename... Args>
void logError(const std::string& tag, fmt::format_string<Args...> format, Args&&... args) {
    log(LogLevel::Error, tag, format, std::forward<Args>(args)...);
}

} // namespace BlockFlow
