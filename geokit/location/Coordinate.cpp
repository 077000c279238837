#include "location/Coordinate.hpp"
#include "core/GeoConstants.hpp"
#include "utils/StringUtils.hpp"

#include <string>

namespace GeoKit {

bool Coordinate::IsValid() const noexcept {
    return Location::IsValidCoordinate(latitude, longitude);
}

namespace Location {

bool IsValidCoordinate(double latitude, double longitude) noexcept {
    const auto& geo = Geodetic();
    return Between(geo.minLatitude, latitude, geo.maxLatitude) &&
           Between(geo.minLongitude, longitude, geo.maxLongitude);
}

std::expected<Coordinate, GeoErrorCode> ParseCoordinate(std::string_view latitude,
                                                        std::string_view longitude) {
    if (StringUtils::Trim(latitude).empty() || StringUtils::Trim(longitude).empty()) {
        return std::unexpected(GeoErrorCode::EmptyInput);
    }

    const auto lat = StringUtils::ParseDouble(latitude);
    const auto lon = StringUtils::ParseDouble(longitude);
    if (!lat || !lon) {
        return std::unexpected(GeoErrorCode::InvalidFormat);
    }

    if (!IsValidCoordinate(*lat, *lon)) {
        return std::unexpected(GeoErrorCode::OutOfRange);
    }

    return Coordinate{*lat, *lon};
}

void ValidateCoordinate(const Coordinate& coordinate) {
    if (!coordinate.IsValid()) {
        throw CoordinateRangeError("Invalid latitude/longitude: " +
                                   StringUtils::FormatNumber(coordinate.latitude) + "," +
                                   StringUtils::FormatNumber(coordinate.longitude));
    }
}

Coordinate CoerceCoordinate(std::string_view latitude, std::string_view longitude) {
    auto parsed = ParseCoordinate(latitude, longitude);
    if (parsed) {
        return *parsed;
    }

    const std::string text = std::string(latitude) + "," + std::string(longitude);
    if (parsed.error() == GeoErrorCode::OutOfRange) {
        throw CoordinateRangeError("Invalid latitude/longitude: " + text);
    }
    throw GeoError(parsed.error(), "Coordinates are not numbers: " + text);
}

} // namespace Location

} // namespace GeoKit
