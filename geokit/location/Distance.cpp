/**
 * @file Distance.cpp
 * @brief Planar and haversine distance implementation
 */

#include "location/Distance.hpp"
#include "core/GeoConstants.hpp"
#include "geohash/Geohash.hpp"

#include <cmath>
#include <limits>
#include <numbers>

namespace GeoKit {
namespace Location {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

} // namespace

double HaversineDistance(const Coordinate& from, const Coordinate& to) noexcept {
    if (!from.IsFinite() || !to.IsFinite()) {
        return kNaN;
    }

    const auto& geo = Geodetic();
    constexpr double halfPi = std::numbers::pi / 2;
    constexpr double pi = std::numbers::pi;

    // Keep asin/atan2 inputs in domain for out-of-range coordinates
    const double lat1Rad = Clamp(-halfPi, from.latitude * geo.radiansPerDegree, halfPi);
    const double lat2Rad = Clamp(-halfPi, to.latitude * geo.radiansPerDegree, halfPi);
    const double deltaLat = Clamp(-pi, (to.latitude - from.latitude) * geo.radiansPerDegree, pi);
    const double deltaLon = Clamp(-pi, (to.longitude - from.longitude) * geo.radiansPerDegree, pi);

    // Rounding can push h just past 1 for antipodal points
    const double h = Clamp(0.0,
                           std::sin(deltaLat / 2) * std::sin(deltaLat / 2) +
                               std::cos(lat1Rad) * std::cos(lat2Rad) *
                               std::sin(deltaLon / 2) * std::sin(deltaLon / 2),
                           1.0);

    const double c = 2 * std::atan2(std::sqrt(h), std::sqrt(1 - h));

    return geo.earthRadiusM * c;
}

double PlanarDistance(const Coordinate& from, const Coordinate& to) noexcept {
    if (!from.IsFinite() || !to.IsFinite()) {
        return kNaN;
    }

    const auto& geo = Geodetic();

    // One degree is R * pi / 180 (about 111,195 m), not Geodetic().metersPerDegree
    // Meridians converge towards the poles; scale longitude by cos(mean latitude)
    const double latScale = std::cos((from.latitude + to.latitude) * geo.radiansPerDegree / 2);
    const double deltaLon = (to.longitude - from.longitude) * geo.radiansPerDegree * latScale;
    const double deltaLat = (to.latitude - from.latitude) * geo.radiansPerDegree;

    return geo.earthRadiusM * std::hypot(deltaLon, deltaLat);
}

double GetDistance(const Coordinate& from, const Coordinate& to,
                   const DistanceOptions& options) noexcept {
    return options.highAccuracy ? HaversineDistance(from, to) : PlanarDistance(from, to);
}

bool CheckLocation(const Coordinate& point, const Coordinate& reference,
                   const CheckOptions& options) noexcept {
    const double distance = GetDistance(reference, point, DistanceOptions{options.highAccuracy});
    return distance < options.radiusMeters;
}

double GetGeohashDistance(std::string_view geohash1, std::string_view geohash2,
                          const DistanceOptions& options) {
    return GetDistance(Geohash::Decode(geohash1), Geohash::Decode(geohash2), options);
}

bool CheckGeohash(std::string_view geohash, const Coordinate& coords,
                  const CheckOptions& options) {
    return CheckLocation(Geohash::Decode(geohash), coords, options);
}

} // namespace Location
} // namespace GeoKit
