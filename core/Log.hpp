#pragma once

#include <spdlog/logger.h>
#include <memory>
#include <string>

namespace geotrack {

enum class LogLevel {
    Off,
    Error,
    Warning,
    Info,
    Debug,
    Verbose
};

std::string logLevelToString(LogLevel level);
LogLevel stringToLogLevel(const std::string& str);

/**
 * @brief One spdlog logger per component tag
 *
 * Loggers share a single stderr sink, so stdout stays free for the CLI's
 * event stream. Lines read "[Tag] message".
 */
class Log {
public:
    // Returns the logger for a tag, creating it at the current level.
    static std::shared_ptr<spdlog::logger> get(const std::string& tag);

    static void setLevel(LogLevel level);
    static LogLevel level();
};

} // namespace geotrack
