#include "core/Logger.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <vector>

namespace GeoKit {

std::shared_ptr<spdlog::logger> Logger::s_coreLogger;
std::shared_ptr<spdlog::logger> Logger::s_appLogger;
bool Logger::s_initialized = false;
std::mutex Logger::s_mutex;

void Logger::Initialize(const std::string& logFile, bool consoleOutput) {
    std::lock_guard<std::mutex> lock(s_mutex);

    // Replace loggers created lazily before explicit setup
    s_initialized = false;
    InitializeLocked(logFile, consoleOutput);
}

void Logger::InitializeLocked(const std::string& logFile, bool consoleOutput) {
    if (s_initialized) {
        return;
    }

    std::vector<spdlog::sink_ptr> sinks;

    // Console sink (stderr so tool output on stdout stays clean)
    if (consoleOutput) {
        auto consoleSink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        consoleSink->set_pattern("%^[%T] [%n] [%l]%$ %v");
        sinks.push_back(consoleSink);
    }

    // File sink
    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logFile, 5 * 1024 * 1024, 3);  // 5MB max, 3 files
        fileSink->set_pattern("[%Y-%m-%d %T.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    // Create library logger
    s_coreLogger = std::make_shared<spdlog::logger>("GEOKIT", sinks.begin(), sinks.end());
    s_coreLogger->set_level(spdlog::level::info);
    s_coreLogger->flush_on(spdlog::level::warn);

    // Create application logger
    s_appLogger = std::make_shared<spdlog::logger>("APP", sinks.begin(), sinks.end());
    s_appLogger->set_level(spdlog::level::info);
    s_appLogger->flush_on(spdlog::level::warn);

    s_initialized = true;
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_initialized) {
        return;
    }

    s_coreLogger->flush();
    s_appLogger->flush();

    s_coreLogger.reset();
    s_appLogger.reset();
    s_initialized = false;
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    std::lock_guard<std::mutex> lock(s_mutex);
    InitializeLocked("", true);
    s_coreLogger->set_level(level);
    s_appLogger->set_level(level);
}

std::shared_ptr<spdlog::logger> Logger::GetCoreLogger() {
    std::lock_guard<std::mutex> lock(s_mutex);
    InitializeLocked("", true);
    return s_coreLogger;
}

std::shared_ptr<spdlog::logger> Logger::GetAppLogger() {
    std::lock_guard<std::mutex> lock(s_mutex);
    InitializeLocked("", true);
    return s_appLogger;
}

bool Logger::IsInitialized() {
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_initialized;
}

} // namespace GeoKit
