/**
 * @file GeoConstants.hpp
 * @brief Geodetic constants and the geohash base32 tables
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <numbers>
#include <string_view>

namespace GeoKit {

/**
 * @brief Process-wide immutable geodetic configuration
 *
 * Built once at compile time; every codec, distance and accuracy
 * routine reads from the same instance returned by Geodetic().
 */
struct GeodeticConstants {
    double earthRadiusM = 6371000.0;                       ///< Mean Earth radius in meters
    double radiansPerDegree = std::numbers::pi / 180.0;
    double metersPerDegree = 111321.0;                     ///< One degree of latitude at the equator
    double minLatitude = -90.0;
    double maxLatitude = 90.0;
    double minLongitude = -180.0;
    double maxLongitude = 180.0;

    std::string_view base32Alphabet = "0123456789bcdefghjkmnpqrstuvwxyz";

    /// Lowercase character -> alphabet index, -1 for characters outside the alphabet
    std::array<int8_t, 256> base32Index{};

    /**
     * @brief Look up the 5-bit value of a geohash character (case-sensitive)
     * @return Index 0-31, or -1 if the character is not in the alphabet
     */
    [[nodiscard]] constexpr int IndexOf(char c) const noexcept {
        return base32Index[static_cast<unsigned char>(c)];
    }
};

namespace detail {

[[nodiscard]] constexpr GeodeticConstants MakeGeodeticConstants() {
    GeodeticConstants constants;
    constants.base32Index.fill(-1);
    for (size_t i = 0; i < constants.base32Alphabet.size(); ++i) {
        constants.base32Index[static_cast<unsigned char>(constants.base32Alphabet[i])] =
            static_cast<int8_t>(i);
    }
    return constants;
}

inline constexpr GeodeticConstants kGeodetic = MakeGeodeticConstants();

} // namespace detail

/**
 * @brief Access the shared geodetic constants
 */
[[nodiscard]] constexpr const GeodeticConstants& Geodetic() noexcept {
    return detail::kGeodetic;
}

/// Number of bits carried by one geohash character
inline constexpr int kBitsPerGeohashChar = 5;

/// Geohash length used when callers do not ask for one
inline constexpr size_t kDefaultGeohashLength = 4;

/// Longest geohash length with a distinct accuracy table entry
inline constexpr size_t kMaxGeohashLength = 12;

} // namespace GeoKit
