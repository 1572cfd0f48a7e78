#include "omr/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace omr {

namespace {

std::atomic<LogLevel> g_minLogLevel{LogLevel::Info};
std::mutex g_logMutex;

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tmBuf{};
    localtime_r(&t, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "[DEBUG]";
        case LogLevel::Info:    return "[INFO]";
        case LogLevel::Warning: return "[WARN]";
        case LogLevel::Error:   return "[ERROR]";
    }
    return "[INFO]";
}

} // namespace

void setLogLevel(LogLevel level) {
    g_minLogLevel = level;
}

LogLevel getLogLevel() {
    return g_minLogLevel;
}

LogLevel parseLogLevel(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "debug") return LogLevel::Debug;
    if (s == "warning" || s == "warn") return LogLevel::Warning;
    if (s == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void log(LogLevel level, const std::string& message) {
    if (level < g_minLogLevel) return;

    // Lines from parallel form workers must not interleave
    std::lock_guard<std::mutex> lock(g_logMutex);
    std::cerr << timestamp() << " " << levelTag(level) << " " << message << std::endl;
}

void logDebug(const std::string& message) { log(LogLevel::Debug, message); }
void logInfo(const std::string& message) { log(LogLevel::Info, message); }
void logWarning(const std::string& message) { log(LogLevel::Warning, message); }
void logError(const std::string& message) { log(LogLevel::Error, message); }

} // namespace omr
