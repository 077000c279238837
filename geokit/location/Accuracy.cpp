#include "location/Accuracy.hpp"
#include "utils/StringUtils.hpp"

#include <cmath>

namespace GeoKit {
namespace Location {

double GeohashAccuracyForLength(size_t length) noexcept {
    if (length >= kGeohashAccuracyTable.size()) {
        return kGeohashAccuracyTable.back();
    }
    return kGeohashAccuracyTable[length];
}

double EstimateGeohashAccuracy(std::string_view geohash) noexcept {
    return GeohashAccuracyForLength(geohash.size());
}

double EstimateGeohashAccuracy(const char* geohash) noexcept {
    if (geohash == nullptr) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return EstimateGeohashAccuracy(std::string_view(geohash));
}

std::optional<size_t> CalculateGeohashLength(double meters) noexcept {
    if (std::isnan(meters) || meters < 0) {
        return std::nullopt;
    }

    // Walk the table from the coarsest entry; the last entry (0 m) always matches
    for (size_t length = 0; length < kGeohashAccuracyTable.size(); ++length) {
        if (kGeohashAccuracyTable[length] <= meters) {
            return length;
        }
    }
    return kMaxGeohashLength;
}

double EstimateCoordinateAccuracy(const Coordinate& coordinate) {
    if (coordinate.accuracy) {
        return *coordinate.accuracy;
    }

    const double latitude = coordinate.latitude;
    if (std::isnan(latitude)) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    const auto& geo = Geodetic();
    const double baseline = geo.metersPerDegree * std::cos(latitude * geo.radiansPerDegree);

    if (std::trunc(latitude) == latitude) {
        return baseline;
    }

    return baseline / std::pow(10.0, StringUtils::CountDecimalDigits(latitude));
}

double EstimateCoordinateAccuracy(std::string_view latitude) {
    const auto parsed = StringUtils::ParseDouble(latitude);
    if (!parsed) {
        return std::numeric_limits<double>::quiet_NaN();
    }

    Coordinate coordinate;
    coordinate.latitude = *parsed;
    return EstimateCoordinateAccuracy(coordinate);
}

double EstimateCoordinateAccuracy(const char* latitude) {
    if (latitude == nullptr) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return EstimateCoordinateAccuracy(std::string_view(latitude));
}

} // namespace Location
} // namespace GeoKit
