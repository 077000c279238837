#include "config/Config.hpp"
#include "core/Logger.hpp"
#include "utils/StringUtils.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>

namespace GeoKit {

namespace {

std::expected<void, ConfigError> WriteJson(const std::filesystem::path& path, const nlohmann::json& data) {
    try {
        // Create parent directories if they don't exist
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }

        std::ofstream file(path);
        if (!file.is_open()) {
            GEOKIT_LOG_ERROR("Failed to open config file for writing: {}", path.string());
            return std::unexpected(ConfigError::WriteError);
        }

        file << std::setw(4) << data << std::endl;
        return {};
    } catch (const std::exception& e) {
        GEOKIT_LOG_ERROR("Failed to save config file: {}", e.what());
        return std::unexpected(ConfigError::WriteError);
    }
}

} // namespace

const char* ConfigErrorToString(ConfigError error) noexcept {
    switch (error) {
        case ConfigError::FileNotFound: return "file_not_found";
        case ConfigError::ParseError: return "parse_error";
        case ConfigError::WriteError: return "write_error";
    }
    return "unknown";
}

Config& Config::Instance() {
    static Config instance;
    return instance;
}

std::expected<void, ConfigError> Config::Load(const std::filesystem::path& filepath) {
    std::unique_lock lock(m_mutex);
    m_filepath = filepath;

    if (!std::filesystem::exists(filepath)) {
        GEOKIT_LOG_WARN("Config file not found: {}. Creating default.", filepath.string());
        if (auto created = CreateDefault(filepath); !created) {
            return created;
        }
    }

    try {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            GEOKIT_LOG_ERROR("Failed to open config file: {}", filepath.string());
            return std::unexpected(ConfigError::FileNotFound);
        }

        m_data = nlohmann::json::parse(file);
        GEOKIT_LOG_INFO("Loaded configuration from: {}", filepath.string());
        return {};
    } catch (const nlohmann::json::exception& e) {
        GEOKIT_LOG_ERROR("Failed to parse config file: {}", e.what());
        return std::unexpected(ConfigError::ParseError);
    }
}

std::expected<void, ConfigError> Config::LoadFromString(std::string_view json) {
    try {
        auto parsed = nlohmann::json::parse(json);
        std::unique_lock lock(m_mutex);
        m_data = std::move(parsed);
        return {};
    } catch (const nlohmann::json::exception& e) {
        GEOKIT_LOG_ERROR("Failed to parse configuration: {}", e.what());
        return std::unexpected(ConfigError::ParseError);
    }
}

std::expected<void, ConfigError> Config::Save(const std::filesystem::path& filepath) {
    std::shared_lock lock(m_mutex);
    const auto& path = filepath.empty() ? m_filepath : filepath;
    if (path.empty()) {
        GEOKIT_LOG_WARN("No config file path set, cannot save");
        return std::unexpected(ConfigError::WriteError);
    }

    auto result = WriteJson(path, m_data);
    if (result) {
        GEOKIT_LOG_INFO("Saved configuration to: {}", path.string());
    }
    return result;
}

std::expected<void, ConfigError> Config::Reload() {
    std::filesystem::path path;
    {
        std::shared_lock lock(m_mutex);
        path = m_filepath;
    }

    if (path.empty()) {
        GEOKIT_LOG_WARN("No config file path set, cannot reload");
        return std::unexpected(ConfigError::FileNotFound);
    }
    return Load(path);
}

void Config::Clear() {
    std::unique_lock lock(m_mutex);
    m_data = nlohmann::json::object();
    m_filepath.clear();
}

bool Config::Has(std::string_view key) const {
    std::shared_lock lock(m_mutex);
    return NavigateToKey(key) != nullptr;
}

nlohmann::json Config::GetJson() const {
    std::shared_lock lock(m_mutex);
    return m_data;
}

nlohmann::json* Config::NavigateToKey(std::string_view key, bool create) {
    nlohmann::json* current = &m_data;
    for (const auto& part : StringUtils::Split(key, '.')) {
        if (!current->is_object()) {
            if (!create) {
                return nullptr;
            }
            *current = nlohmann::json::object();
        }
        if (!current->contains(part)) {
            if (!create) {
                return nullptr;
            }
            (*current)[part] = nlohmann::json::object();
        }
        current = &(*current)[part];
    }
    return current;
}

const nlohmann::json* Config::NavigateToKey(std::string_view key) const {
    const nlohmann::json* current = &m_data;
    for (const auto& part : StringUtils::Split(key, '.')) {
        if (!current->is_object()) {
            return nullptr;
        }
        auto it = current->find(part);
        if (it == current->end()) {
            return nullptr;
        }
        current = &(*it);
    }
    return current;
}

nlohmann::json Config::DefaultValues() {
    nlohmann::json config;

    // Geohash settings
    config["geohash"]["default_length"] = kDefaultGeohashLength;

    // Distance settings
    config["distance"]["high_accuracy"] = false;
    config["distance"]["radius_m"] = 100000.0;

    // Position provider settings
    config["position"]["enable_high_accuracy"] = false;
    config["position"]["maximum_age_ms"] = 0;
    config["position"]["timeout_ms"] = -1;

    // Logging settings
    config["logging"]["level"] = "info";
    config["logging"]["file"] = "";

    return config;
}

std::expected<void, ConfigError> Config::CreateDefault(const std::filesystem::path& filepath) {
    auto result = WriteJson(filepath, DefaultValues());
    if (result) {
        GEOKIT_LOG_INFO("Created default configuration file: {}", filepath.string());
    }
    return result;
}

GeoKitSettings LoadSettings(const Config& config) {
    GeoKitSettings settings;

    const int length = config.Get<int>("geohash.default_length", static_cast<int>(kDefaultGeohashLength));
    if (length >= 1 && length <= static_cast<int>(kMaxGeohashLength)) {
        settings.defaultGeohashLength = static_cast<size_t>(length);
    } else {
        GEOKIT_LOG_WARN("geohash.default_length {} is outside 1-{}, using {}",
                        length, kMaxGeohashLength, kDefaultGeohashLength);
    }

    settings.distance.highAccuracy = config.Get<bool>("distance.high_accuracy", false);
    const double radius = config.Get<double>("distance.radius_m", settings.distance.radiusMeters);
    if (std::isnan(radius) || radius < 0) {
        GEOKIT_LOG_WARN("distance.radius_m {} is negative, using {}", radius, settings.distance.radiusMeters);
    } else {
        settings.distance.radiusMeters = radius;
    }

    settings.position.enableHighAccuracy = config.Get<bool>("position.enable_high_accuracy", false);
    settings.position.maximumAgeMs = config.Get<int64_t>("position.maximum_age_ms", 0);
    settings.position.timeoutMs = config.Get<int64_t>("position.timeout_ms", -1);

    const auto levelName = StringUtils::ToLower(config.Get<std::string>("logging.level", "info"));
    const auto level = spdlog::level::from_str(levelName);
    if (level == spdlog::level::off && levelName != "off") {
        GEOKIT_LOG_WARN("Unknown logging.level '{}', using info", levelName);
    } else {
        settings.logLevel = level;
    }
    settings.logFile = config.Get<std::string>("logging.file", "");

    return settings;
}

} // namespace GeoKit
