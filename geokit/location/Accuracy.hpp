/**
 * @file Accuracy.hpp
 * @brief Positional precision estimates for geohashes and raw coordinates
 */

#pragma once

#include "core/GeoConstants.hpp"
#include "location/Coordinate.hpp"

#include <array>
#include <limits>
#include <optional>
#include <string_view>

namespace GeoKit {
namespace Location {

/**
 * @brief Expected positional error in meters, indexed by geohash length
 *
 * Lengths beyond the table are treated as the last entry (0 m).
 */
inline constexpr std::array<double, kMaxGeohashLength + 1> kGeohashAccuracyTable = {
    std::numeric_limits<double>::infinity(),
    25000000.0,
    630000.0,
    78000.0,
    20000.0,
    2400.0,
    610.0,
    76.0,
    19.0,
    2.4,
    0.6,
    0.0074,
    0.0,
};

/**
 * @brief Expected error in meters for a geohash of the given length
 */
[[nodiscard]] double GeohashAccuracyForLength(size_t length) noexcept;

/**
 * @brief Expected error in meters for a geohash (by its length only)
 */
[[nodiscard]] double EstimateGeohashAccuracy(std::string_view geohash) noexcept;

/**
 * @brief Null-safe overload
 * @return NaN for a null pointer
 */
[[nodiscard]] double EstimateGeohashAccuracy(const char* geohash) noexcept;

/**
 * @brief Shortest geohash length whose expected error is at most meters
 *
 * Infinity maps to 0 and anything below 0.0074 m to 12.
 *
 * @return Length 0-12, or nullopt for negative or NaN input
 */
[[nodiscard]] std::optional<size_t> CalculateGeohashLength(double meters) noexcept;

/**
 * @brief Estimate the precision implied by a coordinate
 *
 * An explicit accuracy is returned unchanged. Otherwise each digit after
 * the decimal point of the latitude narrows one degree of latitude
 * (scaled by cos(latitude)) by a factor of ten.
 *
 * @return Meters, or NaN if the latitude is not a number
 */
[[nodiscard]] double EstimateCoordinateAccuracy(const Coordinate& coordinate);

/**
 * @brief Estimate precision from latitude text (parsed first, NaN if unparseable)
 */
[[nodiscard]] double EstimateCoordinateAccuracy(std::string_view latitude);

/**
 * @brief Null-safe overload
 * @return NaN for a null pointer
 */
[[nodiscard]] double EstimateCoordinateAccuracy(const char* latitude);

} // namespace Location
} // namespace GeoKit
