/**
 * @file Distance.hpp
 * @brief Distance between coordinates and radius checks
 */

#pragma once

#include "location/Coordinate.hpp"

#include <string_view>

namespace GeoKit {
namespace Location {

/**
 * @brief Options for distance calculations
 */
struct DistanceOptions {
    bool highAccuracy = false;      ///< Haversine if true, planar approximation otherwise
};

/**
 * @brief Options for radius checks
 */
struct CheckOptions {
    double radiusMeters = 100000.0; ///< Points must be strictly closer than this
    bool highAccuracy = false;
};

/**
 * @brief Distance between two coordinates in meters
 *
 * The low-accuracy mode is an equirectangular approximation and drifts
 * from the haversine result by a few tenths of a percent over city
 * distances and a few percent between continents.
 *
 * @return Distance in meters, or NaN if any latitude/longitude is not finite
 */
[[nodiscard]] double GetDistance(const Coordinate& from, const Coordinate& to,
                                 const DistanceOptions& options = {}) noexcept;

/**
 * @brief Haversine great-circle distance in meters (NaN for non-finite input)
 */
[[nodiscard]] double HaversineDistance(const Coordinate& from, const Coordinate& to) noexcept;

/**
 * @brief Equirectangular approximation in meters (NaN for non-finite input)
 */
[[nodiscard]] double PlanarDistance(const Coordinate& from, const Coordinate& to) noexcept;

/**
 * @brief Check if point lies strictly within radius of reference
 *
 * Returns false when the distance is NaN.
 */
[[nodiscard]] bool CheckLocation(const Coordinate& point, const Coordinate& reference,
                                 const CheckOptions& options = {}) noexcept;

/**
 * @brief Distance between the centres of two geohash cells
 * @throws GeohashError if either geohash is malformed
 */
[[nodiscard]] double GetGeohashDistance(std::string_view geohash1, std::string_view geohash2,
                                        const DistanceOptions& options = {});

/**
 * @brief Check if the centre of a geohash cell lies within radius of coords
 * @throws GeohashError if the geohash is malformed
 */
[[nodiscard]] bool CheckGeohash(std::string_view geohash, const Coordinate& coords,
                                const CheckOptions& options = {});

} // namespace Location
} // namespace GeoKit
