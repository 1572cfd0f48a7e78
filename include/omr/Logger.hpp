#ifndef OMR_LOGGER_HPP
#define OMR_LOGGER_HPP

#include <string>

namespace omr {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();

// "debug", "info", "warning"/"warn", "error"; unknown names map to Info
LogLevel parseLogLevel(const std::string& name);

void log(LogLevel level, const std::string& message);

void logDebug(const std::string& message);
void logInfo(const std::string& message);
void logWarning(const std::string& message);
void logError(const std::string& message);

} // namespace omr

#endif // OMR_LOGGER_HPP
