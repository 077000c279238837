/**
 * @file test_config.cpp
 * @brief Unit tests for the JSON configuration and typed settings
 */

#include <gtest/gtest.h>

#include "config/Config.hpp"

#include "utils/TestHelpers.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace GeoKit;
using namespace GeoKit::Test;
using json = nlohmann::json;

// =============================================================================
// Config Fixture
// =============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::Instance().Clear();
    }

    void TearDown() override {
        Config::Instance().Clear();
    }

    Config& config = Config::Instance();
};

// =============================================================================
// Key access
// =============================================================================

TEST_F(ConfigTest, MissingKeyReturnsDefault) {
    EXPECT_EQ(7, config.Get<int>("geohash.default_length", 7));
    EXPECT_FALSE(config.Has("geohash.default_length"));
}

TEST_F(ConfigTest, SetCreatesNestedKeys) {
    config.Set("distance.radius_m", 2500.0);

    EXPECT_TRUE(config.Has("distance"));
    EXPECT_TRUE(config.Has("distance.radius_m"));
    EXPECT_DOUBLE_EQ(2500.0, config.Get<double>("distance.radius_m"));
}

TEST_F(ConfigTest, TypeMismatchReturnsDefault) {
    config.Set("logging.level", std::string("debug"));
    EXPECT_EQ(3, config.Get<int>("logging.level", 3));
    EXPECT_EQ("debug", config.Get<std::string>("logging.level"));
}

TEST_F(ConfigTest, KeyThroughScalarIsMissing) {
    config.Set("geohash", 5);
    EXPECT_FALSE(config.Has("geohash.default_length"));
    EXPECT_EQ(4, config.Get<int>("geohash.default_length", 4));
}

TEST_F(ConfigTest, LoadFromStringRejectsMalformedJson) {
    auto result = config.LoadFromString("{ not json");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(ConfigError::ParseError, result.error());
    EXPECT_STREQ("parse_error", ConfigErrorToString(result.error()));
}

// =============================================================================
// Files
// =============================================================================

TEST_F(ConfigTest, LoadCreatesDefaultFile) {
    const auto path = ScratchPath("created.json");
    std::filesystem::remove(path);

    auto result = config.Load(path);
    ASSERT_TRUE(result.has_value());

    EXPECT_TRUE(std::filesystem::exists(path));
    EXPECT_EQ(4, config.Get<int>("geohash.default_length"));
    EXPECT_EQ(-1, config.Get<int64_t>("position.timeout_ms"));
    EXPECT_EQ("info", config.Get<std::string>("logging.level"));
}

TEST_F(ConfigTest, SaveAndReload) {
    const auto path = ScratchPath("saved.json");
    ASSERT_TRUE(config.Load(path).has_value());

    config.Set("distance.high_accuracy", true);
    ASSERT_TRUE(config.Save().has_value());

    config.Set("distance.high_accuracy", false);
    ASSERT_TRUE(config.Reload().has_value());

    EXPECT_TRUE(config.Get<bool>("distance.high_accuracy"));
}

TEST_F(ConfigTest, LoadRejectsMalformedFile) {
    const auto path = ScratchPath("broken.json");
    std::filesystem::create_directories(path.parent_path());
    {
        std::ofstream file(path);
        file << "{ \"geohash\": ";
    }

    auto result = config.Load(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(ConfigError::ParseError, result.error());
}

TEST_F(ConfigTest, ReloadWithoutPathFails) {
    auto result = config.Reload();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(ConfigError::FileNotFound, result.error());
}

TEST_F(ConfigTest, DefaultValuesDocument) {
    const json defaults = Config::DefaultValues();

    EXPECT_EQ(4, defaults["geohash"]["default_length"].get<int>());
    EXPECT_FALSE(defaults["distance"]["high_accuracy"].get<bool>());
    EXPECT_DOUBLE_EQ(100000.0, defaults["distance"]["radius_m"].get<double>());
    EXPECT_FALSE(defaults["position"]["enable_high_accuracy"].get<bool>());
    EXPECT_EQ(0, defaults["position"]["maximum_age_ms"].get<int>());
    EXPECT_EQ(-1, defaults["position"]["timeout_ms"].get<int>());
    EXPECT_EQ("", defaults["logging"]["file"].get<std::string>());
}

// =============================================================================
// Typed settings
// =============================================================================

TEST_F(ConfigTest, SettingsFromEmptyConfigAreDefaults) {
    const GeoKitSettings settings = LoadSettings(config);

    EXPECT_EQ(kDefaultGeohashLength, settings.defaultGeohashLength);
    EXPECT_FALSE(settings.distance.highAccuracy);
    EXPECT_DOUBLE_EQ(100000.0, settings.distance.radiusMeters);
    EXPECT_FALSE(settings.position.enableHighAccuracy);
    EXPECT_EQ(0, settings.position.maximumAgeMs);
    EXPECT_EQ(-1, settings.position.timeoutMs);
    EXPECT_EQ(spdlog::level::info, settings.logLevel);
    EXPECT_TRUE(settings.logFile.empty());
}

TEST_F(ConfigTest, SettingsReadConfiguredValues) {
    ASSERT_TRUE(config.LoadFromString(R"({
        "geohash": { "default_length": 9 },
        "distance": { "high_accuracy": true, "radius_m": 500 },
        "position": { "enable_high_accuracy": true, "maximum_age_ms": 60000, "timeout_ms": 3000 },
        "logging": { "level": "WARN", "file": "geokit.log" }
    })").has_value());

    const GeoKitSettings settings = LoadSettings(config);

    EXPECT_EQ(9u, settings.defaultGeohashLength);
    EXPECT_TRUE(settings.distance.highAccuracy);
    EXPECT_DOUBLE_EQ(500.0, settings.distance.radiusMeters);
    EXPECT_TRUE(settings.position.enableHighAccuracy);
    EXPECT_EQ(60000, settings.position.maximumAgeMs);
    EXPECT_EQ(3000, settings.position.timeoutMs);
    EXPECT_EQ(spdlog::level::warn, settings.logLevel);
    EXPECT_EQ("geokit.log", settings.logFile);
}

TEST_F(ConfigTest, SettingsReplaceInvalidValues) {
    ASSERT_TRUE(config.LoadFromString(R"({
        "geohash": { "default_length": 40 },
        "distance": { "radius_m": -5 },
        "logging": { "level": "chatty" }
    })").has_value());

    const GeoKitSettings settings = LoadSettings(config);

    EXPECT_EQ(kDefaultGeohashLength, settings.defaultGeohashLength);
    EXPECT_DOUBLE_EQ(100000.0, settings.distance.radiusMeters);
    EXPECT_EQ(spdlog::level::info, settings.logLevel);
}
