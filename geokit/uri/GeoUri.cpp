#include "uri/GeoUri.hpp"
#include "core/Logger.hpp"
#include "geohash/Geohash.hpp"
#include "location/Accuracy.hpp"
#include "utils/StringUtils.hpp"

#include <algorithm>
#include <cmath>

namespace GeoKit {
namespace Uri {

namespace {

constexpr std::string_view kScheme = "geo:";

using StringUtils::FormatNumber;

// Replace an existing key in place or append a new one
void SetParameter(ParameterList& list, const std::string& key, const std::string& value) {
    auto it = std::find_if(list.begin(), list.end(),
                           [&key](const auto& entry) { return entry.first == key; });
    if (it != list.end()) {
        it->second = value;
    } else {
        list.emplace_back(key, value);
    }
}

[[noreturn]] void ThrowFormat(std::string_view uri, const std::string& reason) {
    GEOKIT_LOG_DEBUG("Rejected geo URI '{}': {}", uri, reason);
    throw GeoUriError(GeoErrorCode::InvalidFormat, "Invalid geo URI (" + reason + "): " + std::string(uri));
}

[[nodiscard]] double ParseNumber(std::string_view uri, std::string_view text, const char* what) {
    const auto value = StringUtils::ParseDouble(StringUtils::UrlDecode(text));
    if (!value) {
        ThrowFormat(uri, std::string("bad ") + what);
    }
    return *value;
}

void ParseQuery(std::string_view uri, std::string_view query, GeoUriParams& params) {
    for (const auto& pair : StringUtils::Split(query, '&')) {
        if (pair.empty()) {
            continue;
        }

        const auto parts = StringUtils::Split(pair, '=', 2);
        const std::string key = StringUtils::UrlDecode(parts[0]);
        const std::string value = parts.size() > 1 ? StringUtils::UrlDecode(parts[1]) : std::string();

        if (key == "z") {
            const auto zoom = StringUtils::ParseInt(value);
            if (!zoom) {
                ThrowFormat(uri, "bad zoom");
            }
            params.zoom = std::clamp(*zoom, kMinZoom, kMaxZoom);
        } else if (key == "q") {
            params.query = value;
        } else if (key == "t") {
            params.type = value;
        } else {
            params.extensions.emplace_back(key, value);
        }
    }
}

} // namespace

std::string CreateGeoUri(const Coordinate& coords, const GeoUriParams& params) {
    Location::ValidateCoordinate(coords);

    std::string uri(kScheme);
    uri += FormatNumber(coords.latitude);
    uri += ',';
    uri += FormatNumber(coords.longitude);

    if (coords.altitude && *coords.altitude > 0) {
        uri += ',';
        uri += FormatNumber(*coords.altitude);
    }

    if (coords.accuracy && std::isfinite(*coords.accuracy) && *coords.accuracy >= 0) {
        uri += ";u=";
        uri += FormatNumber(*coords.accuracy);
    }

    ParameterList query;

    if (params.zoom && *params.zoom >= kMinZoom && *params.zoom <= kMaxZoom) {
        SetParameter(query, "z", std::to_string(*params.zoom));
    }

    if (params.googleMapsCompatible) {
        SetParameter(query, "q", FormatNumber(coords.latitude) + "," + FormatNumber(coords.longitude));
    } else if (params.query) {
        SetParameter(query, "q", *params.query);
    }

    if (params.type) {
        SetParameter(query, "t", *params.type);
    }

    for (const auto& [key, value] : params.extensions) {
        SetParameter(query, key, value);
    }

    for (size_t i = 0; i < query.size(); ++i) {
        uri += (i == 0) ? '?' : '&';
        uri += StringUtils::UrlEncode(query[i].first);
        uri += '=';
        uri += StringUtils::UrlEncode(query[i].second);
    }

    return uri;
}

std::string CreateGeoUri(std::string_view latitude, std::string_view longitude,
                         const GeoUriParams& params) {
    return CreateGeoUri(Location::CoerceCoordinate(latitude, longitude), params);
}

ParsedGeoUri ParseGeoUri(std::string_view uri) {
    const std::string trimmed = StringUtils::Trim(uri);
    std::string_view rest(trimmed);

    if (!StringUtils::StartsWith(StringUtils::ToLower(rest.substr(0, kScheme.size())), kScheme)) {
        GEOKIT_LOG_DEBUG("Rejected URI with non-geo scheme: '{}'", uri);
        throw GeoUriError(GeoErrorCode::InvalidScheme, "Invalid protocol: " + std::string(uri));
    }
    rest.remove_prefix(kScheme.size());

    if (StringUtils::StartsWith(rest, "//")) {
        const auto authorityEnd = rest.find_first_of("/?#", 2);
        if (rest.substr(2, authorityEnd == std::string_view::npos ? rest.npos : authorityEnd - 2).size() > 0) {
            GEOKIT_LOG_DEBUG("Rejected geo URI with authority: '{}'", uri);
            throw GeoUriError(GeoErrorCode::InvalidScheme, "Geo URI must not have an authority: " + std::string(uri));
        }
    }

    // Fragments carry nothing for geo: URIs
    if (const auto hash = rest.find('#'); hash != std::string_view::npos) {
        rest = rest.substr(0, hash);
    }

    std::string_view query;
    if (const auto question = rest.find('?'); question != std::string_view::npos) {
        query = rest.substr(question + 1);
        rest = rest.substr(0, question);
    }

    ParsedGeoUri result;

    const auto segments = StringUtils::Split(rest, ';');
    const auto coords = StringUtils::Split(segments[0], ',', 3);
    if (coords.size() < 2) {
        ThrowFormat(uri, "expected <lat>,<lon>");
    }

    result.coords.latitude = ParseNumber(uri, coords[0], "latitude");
    result.coords.longitude = ParseNumber(uri, coords[1], "longitude");
    if (coords.size() > 2) {
        result.coords.altitude = ParseNumber(uri, coords[2], "altitude");
    }
    Location::ValidateCoordinate(result.coords);

    for (size_t i = 1; i < segments.size(); ++i) {
        if (segments[i].empty()) {
            continue;
        }
        const auto parts = StringUtils::Split(segments[i], '=', 2);
        const std::string key = StringUtils::ToLower(parts[0]);
        const std::string value = parts.size() > 1 ? parts[1] : std::string();

        if (key == "u") {
            const double uncertainty = ParseNumber(uri, value, "uncertainty");
            if (!std::isfinite(uncertainty) || uncertainty < 0) {
                ThrowFormat(uri, "uncertainty must be a non-negative number");
            }
            result.coords.accuracy = uncertainty;
        } else {
            result.params.uriParameters.emplace_back(key, StringUtils::UrlDecode(value));
        }
    }

    ParseQuery(uri, query, result.params);

    return result;
}

std::string GeoUriToGeohash(std::string_view uri) {
    const auto parsed = ParseGeoUri(uri);

    const double accuracy = Location::EstimateCoordinateAccuracy(parsed.coords);
    const auto length = Location::CalculateGeohashLength(accuracy).value_or(kDefaultGeohashLength);

    return Geohash::Encode(parsed.coords, length);
}

std::string GeohashToGeoUri(std::string_view geohash, const GeohashUriOptions& options) {
    Coordinate coords = Geohash::Decode(geohash);
    coords.altitude = options.altitude;
    coords.accuracy = Location::EstimateGeohashAccuracy(geohash);

    GeoUriParams params;
    params.googleMapsCompatible = options.googleMapsCompatible;
    params.zoom = options.zoom;

    return CreateGeoUri(coords, params);
}

} // namespace Uri
} // namespace GeoKit
