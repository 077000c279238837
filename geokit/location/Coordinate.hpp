/**
 * @file Coordinate.hpp
 * @brief Coordinate value type and coordinate validation helpers
 */

#pragma once

#include "core/GeoError.hpp"

#include <algorithm>
#include <cmath>
#include <expected>
#include <limits>
#include <optional>
#include <string_view>

namespace GeoKit {

/**
 * @brief WGS84 decimal-degree coordinate
 *
 * A default-constructed coordinate has NaN latitude/longitude, which
 * numeric routines treat as "not a well-formed number".
 */
struct Coordinate {
    double latitude = std::numeric_limits<double>::quiet_NaN();    ///< Degrees (-90 to 90)
    double longitude = std::numeric_limits<double>::quiet_NaN();   ///< Degrees (-180 to 180)
    std::optional<double> altitude;     ///< Meters above the reference surface
    std::optional<double> accuracy;     ///< Horizontal accuracy in meters

    Coordinate() = default;
    Coordinate(double lat, double lon) : latitude(lat), longitude(lon) {}

    /**
     * @brief Check that latitude and longitude are finite numbers
     */
    [[nodiscard]] bool IsFinite() const noexcept {
        return std::isfinite(latitude) && std::isfinite(longitude);
    }

    /**
     * @brief Check if coordinates are within the valid ranges
     */
    [[nodiscard]] bool IsValid() const noexcept;

    bool operator==(const Coordinate& other) const = default;
};

namespace Location {

/**
 * @brief Clamp a value to [min, max]
 */
[[nodiscard]] constexpr double Clamp(double min, double value, double max) noexcept {
    return std::min(std::max(value, min), max);
}

/**
 * @brief Check if value is within [min, max] (false for NaN)
 */
[[nodiscard]] constexpr bool Between(double min, double value, double max) noexcept {
    return !(value < min || value > max) && value == value;
}

/**
 * @brief Check if latitude/longitude describe a possible position
 */
[[nodiscard]] bool IsValidCoordinate(double latitude, double longitude) noexcept;

/**
 * @brief Parse and validate coordinate text
 *
 * Phase one converts both strings to numbers (InvalidFormat / EmptyInput
 * on failure); phase two checks the ranges (OutOfRange).
 */
[[nodiscard]] std::expected<Coordinate, GeoErrorCode> ParseCoordinate(std::string_view latitude,
                                                                      std::string_view longitude);

/**
 * @brief Validate numeric coordinates
 * @throws CoordinateRangeError if either value is outside its range or not a number
 */
void ValidateCoordinate(const Coordinate& coordinate);

/**
 * @brief Parse-then-validate, throwing on failure
 * @throws CoordinateRangeError for out-of-range values
 * @throws GeoError (InvalidFormat / EmptyInput) for unparseable text
 */
[[nodiscard]] Coordinate CoerceCoordinate(std::string_view latitude, std::string_view longitude);

} // namespace Location

} // namespace GeoKit
