#pragma once

#include "core/GeoConstants.hpp"
#include "location/Distance.hpp"
#include "platform/LocationService.hpp"

#include <expected>
#include <filesystem>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>
#include <spdlog/common.h>

namespace GeoKit {

/**
 * @brief Configuration load/save failures
 */
enum class ConfigError {
    FileNotFound,
    ParseError,
    WriteError
};

[[nodiscard]] const char* ConfigErrorToString(ConfigError error) noexcept;

/**
 * @brief JSON-based configuration for the toolkit's defaults
 *
 * Values are addressed by dot-separated keys ("distance.radius_m").
 * Missing keys and type mismatches fall back to the caller's default.
 */
class Config {
public:
    static Config& Instance();

    // Delete copy/move for singleton
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * @brief Load configuration from JSON file
     *
     * A missing file is first created with the default values.
     *
     * @param filepath Path to configuration file
     */
    std::expected<void, ConfigError> Load(const std::filesystem::path& filepath);

    /**
     * @brief Replace the configuration with a JSON document held in memory
     */
    std::expected<void, ConfigError> LoadFromString(std::string_view json);

    /**
     * @brief Save current configuration to JSON file
     * @param filepath Path to save to (uses loaded path if empty)
     */
    std::expected<void, ConfigError> Save(const std::filesystem::path& filepath = "");

    /**
     * @brief Reload configuration from disk
     */
    std::expected<void, ConfigError> Reload();

    /**
     * @brief Drop every value and forget the loaded path
     */
    void Clear();

    /**
     * @brief Get a configuration value with type safety
     * @tparam T The expected type
     * @param key Dot-separated key path (e.g., "geohash.default_length")
     * @param defaultValue Value to return if key not found or of another type
     */
    template<typename T>
    [[nodiscard]] T Get(std::string_view key, const T& defaultValue = T{}) const;

    /**
     * @brief Set a configuration value, creating intermediate objects
     */
    template<typename T>
    void Set(std::string_view key, const T& value);

    /**
     * @brief Check if a key exists
     */
    [[nodiscard]] bool Has(std::string_view key) const;

    /**
     * @brief Copy of the underlying JSON document
     */
    [[nodiscard]] nlohmann::json GetJson() const;

    /**
     * @brief Default configuration document
     */
    [[nodiscard]] static nlohmann::json DefaultValues();

    /**
     * @brief Create default configuration file
     */
    static std::expected<void, ConfigError> CreateDefault(const std::filesystem::path& filepath);

private:
    Config() = default;
    ~Config() = default;

    nlohmann::json m_data = nlohmann::json::object();
    std::filesystem::path m_filepath;
    mutable std::shared_mutex m_mutex;

    nlohmann::json* NavigateToKey(std::string_view key, bool create);
    const nlohmann::json* NavigateToKey(std::string_view key) const;
};

// Template implementations
template<typename T>
T Config::Get(std::string_view key, const T& defaultValue) const {
    std::shared_lock lock(m_mutex);
    const auto* node = NavigateToKey(key);
    if (!node || node->is_null()) {
        return defaultValue;
    }

    try {
        return node->get<T>();
    } catch (const nlohmann::json::exception&) {
        return defaultValue;
    }
}

template<typename T>
void Config::Set(std::string_view key, const T& value) {
    std::unique_lock lock(m_mutex);
    if (auto* node = NavigateToKey(key, true)) {
        *node = value;
    }
}

/**
 * @brief Typed view of the configuration used by the command-line tool
 */
struct GeoKitSettings {
    size_t defaultGeohashLength = kDefaultGeohashLength;
    Location::CheckOptions distance;
    Platform::PositionOptions position;
    spdlog::level::level_enum logLevel = spdlog::level::info;
    std::string logFile;
};

/**
 * @brief Read GeoKitSettings from a configuration
 *
 * Out-of-range values are replaced by their defaults with a warning.
 */
[[nodiscard]] GeoKitSettings LoadSettings(const Config& config = Config::Instance());

} // namespace GeoKit
