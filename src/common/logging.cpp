#include "dxwatch/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <mutex>

namespace dxwatch {

namespace {

std::atomic<int> g_min_level{static_cast<int>(LogLevel::INFO)};
std::mutex g_log_mutex;
FILE* g_log_file = nullptr;

void formatTimestamp(char* buf, size_t len) {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc{};
#ifdef _WIN32
    gmtime_s(&tm_utc, &t);
#else
    gmtime_r(&t, &tm_utc);
#endif
    std::strftime(buf, len, "%Y-%m-%d %H:%M:%S", &tm_utc);
}

} // namespace

const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF:   return "OFF";
        default: return "?";
    }
}

const char* logCategoryToString(LogCategory cat) {
    switch (cat) {
        case LogCategory::Cluster: return "CLUSTER";
        case LogCategory::Parse:   return "PARSE";
        case LogCategory::Dxcc:    return "DXCC";
        case LogCategory::Award:   return "AWARD";
        case LogCategory::Spots:   return "SPOTS";
        case LogCategory::App:     return "APP";
        default: return "?";
    }
}

LogLevel stringToLogLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "OFF" || upper == "NONE") return LogLevel::OFF;
    return LogLevel::INFO;
}

void setLogLevel(LogLevel level) {
    g_min_level = static_cast<int>(level);
}

LogLevel getLogLevel() {
    return static_cast<LogLevel>(g_min_level.load());
}

bool setLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);

    if (g_log_file) {
        std::fclose(g_log_file);
        g_log_file = nullptr;
    }
    if (path.empty()) {
        return true;
    }

    g_log_file = std::fopen(path.c_str(), "a");
    return g_log_file != nullptr;
}

void logMessageV(LogCategory cat, LogLevel level, const char* fmt, va_list args) {
    char msg[1024];
    std::vsnprintf(msg, sizeof(msg), fmt, args);

    char ts[32];
    formatTimestamp(ts, sizeof(ts));

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::fprintf(stderr, "%s [%s] [%s] %s\n",
                 ts, logLevelToString(level), logCategoryToString(cat), msg);
    if (g_log_file) {
        std::fprintf(g_log_file, "%s [%s] [%s] %s\n",
                     ts, logLevelToString(level), logCategoryToString(cat), msg);
        std::fflush(g_log_file);
    }
}

void logMessage(LogCategory cat, LogLevel level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    logMessageV(cat, level, fmt, args);
    va_end(args);
}

} // namespace dxwatch
