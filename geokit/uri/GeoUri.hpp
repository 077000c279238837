/**
 * @file GeoUri.hpp
 * @brief geo: URI (RFC 5870) creation and parsing
 *
 * Format: geo:<lat>,<lon>[,<alt>][;u=<accuracy>][?z=<zoom>&q=<query>&t=<type>&...]
 */

#pragma once

#include "location/Coordinate.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace GeoKit {
namespace Uri {

/// Ordered (key, value) pairs
using ParameterList = std::vector<std::pair<std::string, std::string>>;

/// Zoom levels accepted by map applications
inline constexpr int kMinZoom = 1;
inline constexpr int kMaxZoom = 21;

/**
 * @brief Query and extension parameters of a geo: URI
 */
struct GeoUriParams {
    std::optional<int> zoom;            ///< "z", only written when within [1, 21]
    std::optional<std::string> query;   ///< "q", search text
    std::optional<std::string> type;    ///< "t", location type (e.g. "poi")

    /// Write "q=<lat>,<lon>" for Google Maps instead of query (create only)
    bool googleMapsCompatible = false;

    /// Additional query parameters, written and parsed in order
    ParameterList extensions;

    /// Extra ";key=value" URI parameters other than "u" (parse only)
    ParameterList uriParameters;

    bool operator==(const GeoUriParams& other) const = default;
};

/**
 * @brief Result of parsing a geo: URI
 */
struct ParsedGeoUri {
    Coordinate coords;
    GeoUriParams params;
};

/**
 * @brief Options when building a URI from a geohash
 */
struct GeohashUriOptions {
    bool googleMapsCompatible = false;
    std::optional<double> altitude;
    std::optional<int> zoom;
};

/**
 * @brief Build a geo: URI
 *
 * Altitude is written only when positive and accuracy only when it is a
 * finite non-negative number.
 *
 * @throws CoordinateRangeError if latitude/longitude are out of range or not numbers
 */
[[nodiscard]] std::string CreateGeoUri(const Coordinate& coords, const GeoUriParams& params = {});

/**
 * @brief Build a geo: URI from coordinate text (parse-then-validate)
 * @throws CoordinateRangeError, GeoError
 */
[[nodiscard]] std::string CreateGeoUri(std::string_view latitude, std::string_view longitude,
                                       const GeoUriParams& params = {});

/**
 * @brief Parse a geo: URI
 * @throws GeoUriError for a wrong scheme, an authority, or a malformed body
 * @throws CoordinateRangeError if the coordinates are out of range
 */
[[nodiscard]] ParsedGeoUri ParseGeoUri(std::string_view uri);

/**
 * @brief Convert a geo: URI to a geohash sized by its uncertainty
 *
 * Uses the "u" parameter when present, otherwise the precision implied by
 * the latitude's decimal digits.
 */
[[nodiscard]] std::string GeoUriToGeohash(std::string_view uri);

/**
 * @brief Convert a geohash to a geo: URI of its cell centre
 * @throws GeohashError if the geohash is malformed
 */
[[nodiscard]] std::string GeohashToGeoUri(std::string_view geohash,
                                          const GeohashUriOptions& options = {});

} // namespace Uri
} // namespace GeoKit
