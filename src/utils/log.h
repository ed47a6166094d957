#ifndef TEXTEXPANDER_LOG_H
#define TEXTEXPANDER_LOG_H

#include <functional>
#include <string>

namespace textexpander {
namespace utils {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

using LogSink = std::function<void(LogLevel, const std::string&)>;

// Messages below the minimum level are dropped (default: Info)
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Replace the output sink; an empty function restores stderr
void setLogSink(LogSink sink);

void logMessage(LogLevel level, const std::string& message);

inline void debugLog(const std::string& message) { logMessage(LogLevel::Debug, message); }
inline void infoLog(const std::string& message) { logMessage(LogLevel::Info, message); }
inline void warnLog(const std::string& message) { logMessage(LogLevel::Warning, message); }
inline void errorLog(const std::string& message) { logMessage(LogLevel::Error, message); }

const char* logLevelName(LogLevel level);

} // namespace utils
} // namespace textexpander

#endif // TEXTEXPANDER_LOG_H
