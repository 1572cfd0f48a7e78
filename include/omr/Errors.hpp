#ifndef OMR_ERRORS_HPP
#define OMR_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace omr {

// Base class for every error the pipeline surfaces to its caller
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& message)
        : std::runtime_error(message) {}
};

// Document unreadable, unsupported, or without pages
class LoadError : public Error {
public:
    explicit LoadError(const std::string& message)
        : Error("Load error: " + message) {}
};

// No subjects could be resolved (empty list and no phase code)
class LayoutError : public Error {
public:
    explicit LayoutError(const std::string& message)
        : Error("Layout error: " + message) {}
};

// Configuration file unreadable or values out of range
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message)
        : Error("Config error: " + message) {}
};

} // namespace omr

#endif // OMR_ERRORS_HPP
