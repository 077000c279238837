#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <mutex>
#include <string>

namespace GeoKit {

/**
 * @brief Logging system wrapper around spdlog
 *
 * Provides convenient logging macros and initialization. The loggers are
 * created on first use with console output when Initialize() was never
 * called, so library code can log without any setup.
 */
class Logger {
public:
    /**
     * @brief Initialize the logging system, replacing any existing sinks
     * @param logFile Optional file path for logging
     * @param consoleOutput Enable console output
     */
    static void Initialize(const std::string& logFile = "",
                          bool consoleOutput = true);

    /**
     * @brief Shutdown the logging system
     */
    static void Shutdown();

    /**
     * @brief Set the minimum log level
     */
    static void SetLevel(spdlog::level::level_enum level);

    /**
     * @brief Get the library logger
     */
    static std::shared_ptr<spdlog::logger> GetCoreLogger();

    /**
     * @brief Get the application logger
     */
    static std::shared_ptr<spdlog::logger> GetAppLogger();

    [[nodiscard]] static bool IsInitialized();

private:
    static void InitializeLocked(const std::string& logFile, bool consoleOutput);

    static std::shared_ptr<spdlog::logger> s_coreLogger;
    static std::shared_ptr<spdlog::logger> s_appLogger;
    static bool s_initialized;
    static std::mutex s_mutex;
};

} // namespace GeoKit

// Convenience macros for library logging
#define GEOKIT_LOG_TRACE(...)    ::GeoKit::Logger::GetCoreLogger()->trace(__VA_ARGS__)
#define GEOKIT_LOG_DEBUG(...)    ::GeoKit::Logger::GetCoreLogger()->debug(__VA_ARGS__)
#define GEOKIT_LOG_INFO(...)     ::GeoKit::Logger::GetCoreLogger()->info(__VA_ARGS__)
#define GEOKIT_LOG_WARN(...)     ::GeoKit::Logger::GetCoreLogger()->warn(__VA_ARGS__)
#define GEOKIT_LOG_ERROR(...)    ::GeoKit::Logger::GetCoreLogger()->error(__VA_ARGS__)
#define GEOKIT_LOG_CRITICAL(...) ::GeoKit::Logger::GetCoreLogger()->critical(__VA_ARGS__)

// Convenience macros for application logging
#define APP_LOG_TRACE(...)    ::GeoKit::Logger::GetAppLogger()->trace(__VA_ARGS__)
#define APP_LOG_DEBUG(...)    ::GeoKit::Logger::GetAppLogger()->debug(__VA_ARGS__)
#define APP_LOG_INFO(...)     ::GeoKit::Logger::GetAppLogger()->info(__VA_ARGS__)
#define APP_LOG_WARN(...)     ::GeoKit::Logger::GetAppLogger()->warn(__VA_ARGS__)
#define APP_LOG_ERROR(...)    ::GeoKit::Logger::GetAppLogger()->error(__VA_ARGS__)
#define APP_LOG_CRITICAL(...) ::GeoKit::Logger::GetAppLogger()->critical(__VA_ARGS__)
