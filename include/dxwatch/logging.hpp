#pragma once

#include <cstdarg>
#include <string>

namespace dxwatch {

// Log severities, lowest first
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5
};

// Subsystem tags printed with every line
enum class LogCategory {
    Cluster,   // network link and command channel
    Parse,     // line protocol
    Dxcc,      // entity resolution
    Award,     // award tables and ADIF import
    Spots,     // classification buffers
    App        // CLI, settings
};

const char* logLevelToString(LogLevel level);
const char* logCategoryToString(LogCategory cat);

// Parse "TRACE".."ERROR"/"OFF" (case-insensitive). Unknown names return INFO.
LogLevel stringToLogLevel(const std::string& name);

// Global minimum level (default INFO)
void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// Mirror log output to a file (appended). Empty path closes the file sink.
bool setLogFile(const std::string& path);

inline bool logEnabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(getLogLevel());
}

#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 3, 4)))
#endif
void logMessage(LogCategory cat, LogLevel level, const char* fmt, ...);

void logMessageV(LogCategory cat, LogLevel level, const char* fmt, va_list args);

} // namespace dxwatch

#define DXW_LOG(cat, level, ...)                                                   \
    do {                                                                           \
        if (::dxwatch::logEnabled(::dxwatch::LogLevel::level)) {                   \
            ::dxwatch::logMessage(::dxwatch::LogCategory::cat,                     \
                                  ::dxwatch::LogLevel::level, __VA_ARGS__);        \
        }                                                                          \
    } while (0)

#define LOG_CLUSTER(level, ...) DXW_LOG(Cluster, level, __VA_ARGS__)
#define LOG_PARSE(level, ...)   DXW_LOG(Parse, level, __VA_ARGS__)
#define LOG_DXCC(level, ...)    DXW_LOG(Dxcc, level, __VA_ARGS__)
#define LOG_AWARD(level, ...)   DXW_LOG(Award, level, __VA_ARGS__)
#define LOG_SPOTS(level, ...)   DXW_LOG(Spots, level, __VA_ARGS__)
#define LOG_APP(level, ...)     DXW_LOG(App, level, __VA_ARGS__)
