#ifndef LOG_H
#define LOG_H

#include <string>

enum class LogLevel {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Off
};

void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();
bool LogEnabled(LogLevel level);

// Returns false and leaves `out` untouched for unknown names.
bool ParseLogLevel(const std::string& name, LogLevel& out);
const char* LogLevelName(LogLevel level);

// Hex dumps of device command blocks, independent of the level.
void SetProtocolTrace(bool enabled);
bool ProtocolTraceEnabled();

void LogMessage(LogLevel level, const std::string& tag, const std::string& message);

inline void LogTrace(const std::string& tag, const std::string& message) { LogMessage(LogLevel::Trace, tag, message); }
inline void LogDebug(const std::string& tag, const std::string& message) { LogMessage(LogLevel::Debug, tag, message); }
inline void LogInfo(const std::string& tag, const std::string& message) { LogMessage(LogLevel::Info, tag, message); }
inline void LogWarn(const std::string& tag, const std::string& message) { LogMessage(LogLevel::Warn, tag, message); }
inline void LogError(const std::string& tag, const std::string& message) { LogMessage(LogLevel::Error, tag, message); }

#endif // LOG_H
