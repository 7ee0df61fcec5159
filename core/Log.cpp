#include "Log.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <atomic>
#include <mutex>
#include <unordered_map>

namespace geotrack {

namespace {

std::atomic<LogLevel> currentLevel{LogLevel::Info};

std::mutex& registryMutex() {
    static std::mutex mutex;
    return mutex;
}

spdlog::sink_ptr sharedSink() {
    static spdlog::sink_ptr sink = [] {
        auto stderrSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        stderrSink->set_pattern("[%n] %v");
        return stderrSink;
    }();
    return sink;
}

spdlog::level::level_enum toSpdlog(LogLevel level) {
    switch (level) {
        case LogLevel::Off: return spdlog::level::off;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Warning: return spdlog::level::warn;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Verbose: return spdlog::level::trace;
    }
    return spdlog::level::info;
}

} // namespace

std::shared_ptr<spdlog::logger> Log::get(const std::string& tag) {
    std::lock_guard<std::mutex> lock(registryMutex());
    if (auto existing = spdlog::get(tag)) {
        return existing;
    }

    auto logger = std::make_shared<spdlog::logger>(tag, sharedSink());
    logger->set_level(toSpdlog(currentLevel.load()));
    spdlog::register_logger(logger);
    return logger;
}

void Log::setLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(registryMutex());
    currentLevel.store(level);
    auto spdLevel = toSpdlog(level);
    spdlog::apply_all([spdLevel](const std::shared_ptr<spdlog::logger>& logger) {
        logger->set_level(spdLevel);
    });
}

LogLevel Log::level() {
    return currentLevel.load();
}

std::string logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Off: return "off";
        case LogLevel::Error: return "error";
        case LogLevel::Warning: return "warning";
        case LogLevel::Info: return "info";
        case LogLevel::Debug: return "debug";
        case LogLevel::Verbose: return "verbose";
        default: return "info";
    }
}

LogLevel stringToLogLevel(const std::string& str) {
    static const std::unordered_map<std::string, LogLevel> levelMap = {
        {"off", LogLevel::Off},
        {"error", LogLevel::Error},
        {"warning", LogLevel::Warning},
        {"info", LogLevel::Info},
        {"debug", LogLevel::Debug},
        {"verbose", LogLevel::Verbose}
    };

    auto it = levelMap.find(str);
    return (it != levelMap.end()) ? it->second : LogLevel::Info;
}

} // namespace geotrack
