#include "Log.h"
#include "utils.h"
#include <atomic>
#include <chrono>
#include <iostream>
#include <mutex>

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::atomic<bool> g_protocol_trace{false};
std::mutex g_log_mutex;
}

void SetLogLevel(LogLevel level) {
    g_level = static_cast<int>(level);
}

LogLevel GetLogLevel() {
    return static_cast<LogLevel>(g_level.load());
}

void SetProtocolTrace(bool enabled) {
    g_protocol_trace = enabled;
}

bool ProtocolTraceEnabled() {
    return g_protocol_trace.load() || LogEnabled(LogLevel::Trace);
}

bool LogEnabled(LogLevel level) {
    return level != LogLevel::Off && static_cast<int>(level) >= g_level.load();
}

bool ParseLogLevel(const std::string& name, LogLevel& out) {
    std::string n = to_lower(trim(name));
    if (n == "trace") out = LogLevel::Trace;
    else if (n == "debug") out = LogLevel::Debug;
    else if (n == "info") out = LogLevel::Info;
    else if (n == "warn" || n == "warning") out = LogLevel::Warn;
    else if (n == "error") out = LogLevel::Error;
    else if (n == "off" || n == "none") out = LogLevel::Off;
    else return false;
    return true;
}

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off: return "OFF";
    }
    return "?";
}

void LogMessage(LogLevel level, const std::string& tag, const std::string& message) {
    if (!LogEnabled(level)) return;
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(
                    std::chrono::system_clock::now().time_since_epoch()).count();
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ostream& out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    out << "[" << secs << "] " << LogLevelName(level) << " [" << tag << "] " << message
        << '\n' << std::flush;
}
