// BlockFlowLog.cpp
#include "BlockFlowLog.hpp"
#include <atomic>
#include <cstdio>
#include <mutex>

namespace BlockFlow {

namespace {
std::atomic<int> gLevel{static_cast<int>(LogLevel::Warn)};
std::mutex gSinkMutex;
LogSink gSink;
} // namespace

void setLogLevel(LogLevel level) { gLevel.store(static_cast<int>(level)); }

LogLevel logLevel() { return static_cast<LogLevel>(gLevel.load()); }

bool parseLogLevel(const std::string& text, LogLevel& out) {
    if (text == "debug") { out = LogLevel::Debug; return true; }
    if (text == "info")  { out = LogLevel::Info;  return true; }
    if (text == "warn")  { out = LogLevel::Warn;  return true; }
    if (text == "error") { out = LogLevel::Error; return true; }
    if (text == "off")   { out = LogLevel::Off;   return true; }
    return false;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "?";
}

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(gSinkMutex);
    gSink = std::move(sink);
}

void writeLog(LogLevel level, const std::string& tag, const std::string& message) {
    // Called outside the lock so a sink may log or replace itself.
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(gSinkMutex);
        sink = gSink;
    }
    if (sink) {
        sink(level, tag, message);
        return;
    }
    fmt::print(stderr, "[{}][{}] {}\n", logLevelName(level), tag, message);
}

} // namespace BlockFlow
