/**
 * @file Geohash.hpp
 * @brief Geohash encoding and decoding
 *
 * A geohash interleaves longitude and latitude bisection bits (longitude
 * first) and packs every 5 bits into one base32 symbol.
 */

#pragma once

#include "core/GeoConstants.hpp"
#include "core/GeoError.hpp"
#include "location/Coordinate.hpp"

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

namespace GeoKit {
namespace Geohash {

/**
 * @brief Closed [min, max] range on one axis
 */
struct Interval {
    double min = 0.0;
    double max = 0.0;

    [[nodiscard]] double Mid() const noexcept { return (min + max) / 2; }
    [[nodiscard]] double Width() const noexcept { return max - min; }
    [[nodiscard]] bool Contains(double value) const noexcept {
        return value >= min && value <= max;
    }

    bool operator==(const Interval& other) const = default;
};

/**
 * @brief Latitude/longitude cell described by a geohash
 */
struct Bounds {
    Interval latitude{-90.0, 90.0};
    Interval longitude{-180.0, 180.0};

    /**
     * @brief Centre of the cell
     */
    [[nodiscard]] Coordinate Center() const {
        return Coordinate{latitude.Mid(), longitude.Mid()};
    }

    [[nodiscard]] bool Contains(const Coordinate& point) const noexcept {
        return latitude.Contains(point.latitude) && longitude.Contains(point.longitude);
    }

    bool operator==(const Bounds& other) const = default;
};

/**
 * @brief Encode a coordinate as a geohash
 * @param coordinate Position to encode (only latitude/longitude are used)
 * @param length Number of output characters (0 yields an empty string)
 */
[[nodiscard]] std::string Encode(const Coordinate& coordinate,
                                 size_t length = kDefaultGeohashLength);

/**
 * @brief Decode a geohash to the centre of its cell
 * @throws GeohashError if the geohash is empty or contains invalid characters
 */
[[nodiscard]] Coordinate Decode(std::string_view geohash);

/**
 * @brief Decode a C string geohash
 * @throws GeohashError with GeoErrorCode::InvalidType for a null pointer
 */
[[nodiscard]] Coordinate Decode(const char* geohash);

/**
 * @brief Decode a geohash to its bounding box
 * @throws GeohashError
 */
[[nodiscard]] Bounds DecodeBounds(std::string_view geohash);
[[nodiscard]] Bounds DecodeBounds(const char* geohash);

/**
 * @brief Alias of DecodeBounds
 */
[[nodiscard]] inline Bounds GetBounds(std::string_view geohash) {
    return DecodeBounds(geohash);
}

[[nodiscard]] inline Bounds GetBounds(const char* geohash) {
    return DecodeBounds(geohash);
}

/**
 * @brief Non-throwing bounding box decode
 */
[[nodiscard]] std::expected<Bounds, GeoErrorCode> TryDecodeBounds(std::string_view geohash) noexcept;

/**
 * @brief Convert each geohash character to its 0-31 alphabet index
 *
 * The result has one byte per input character and is meant for compact
 * storage, not for use as a position.
 *
 * @throws GeohashError
 */
[[nodiscard]] std::vector<uint8_t> ToBytes(std::string_view geohash);
[[nodiscard]] std::vector<uint8_t> ToBytes(const char* geohash);

/**
 * @brief Check if every character of the string is a geohash symbol
 *        (case-insensitive); the empty string is not valid
 */
[[nodiscard]] bool IsValid(std::string_view geohash) noexcept;

} // namespace Geohash
} // namespace GeoKit
