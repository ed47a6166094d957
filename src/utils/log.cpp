#include "log.h"
#include <iostream>
#include <mutex>

namespace textexpander {
namespace utils {

namespace {

std::mutex& logMutex() {
    static std::mutex mutex;
    return mutex;
}

LogLevel& minimumLevel() {
    static LogLevel level = LogLevel::Info;
    return level;
}

LogSink& currentSink() {
    static LogSink sink;
    return sink;
}

} // namespace

void setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(logMutex());
    minimumLevel() = level;
}

LogLevel getLogLevel() {
    std::lock_guard<std::mutex> lock(logMutex());
    return minimumLevel();
}

void setLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(logMutex());
    currentSink() = std::move(sink);
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "?";
    }
}

void logMessage(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(logMutex());
    if (static_cast<int>(level) < static_cast<int>(minimumLevel())) {
        return;
    }

    if (currentSink()) {
        currentSink()(level, message);
        return;
    }

    std::cerr << "[textexpander] " << logLevelName(level) << ": " << message << std::endl;
}

} // namespace utils
} // namespace textexpander
