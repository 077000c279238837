/**
 * @file GeoError.hpp
 * @brief Typed errors for structural (hard) failures
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace GeoKit {

/**
 * @brief Error categories for hard failures
 */
enum class GeoErrorCode {
    InvalidType,        ///< Input missing or of the wrong kind (e.g. null geohash)
    EmptyInput,         ///< Empty geohash or coordinate text
    InvalidCharacter,   ///< Character outside the geohash alphabet
    OutOfRange,         ///< Latitude/longitude outside the valid range
    InvalidFormat,      ///< Malformed number or URI shape
    InvalidScheme       ///< URI scheme is not "geo:" or carries an authority
};

/**
 * @brief Get a short name for an error code
 */
[[nodiscard]] std::string_view GeoErrorCodeToString(GeoErrorCode code) noexcept;

/**
 * @brief Base exception for geohash, coordinate and URI failures
 */
class GeoError : public std::runtime_error {
public:
    GeoError(GeoErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , m_code(code) {}

    [[nodiscard]] GeoErrorCode GetCode() const noexcept {
        return m_code;
    }

private:
    GeoErrorCode m_code;
};

/**
 * @brief Thrown when a geohash is null, empty or contains invalid characters
 */
class GeohashError : public GeoError {
public:
    using GeoError::GeoError;
};

/**
 * @brief Thrown when a coordinate falls outside [-90,90] x [-180,180]
 */
class CoordinateRangeError : public GeoError {
public:
    explicit CoordinateRangeError(const std::string& message)
        : GeoError(GeoErrorCode::OutOfRange, message) {}
};

/**
 * @brief Thrown when a geo: URI cannot be parsed
 */
class GeoUriError : public GeoError {
public:
    using GeoError::GeoError;
};

} // namespace GeoKit
