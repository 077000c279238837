/**
 * @file Geohash.cpp
 * @brief Geohash bisection codec
 */

#include "geohash/Geohash.hpp"
#include "core/Logger.hpp"

#include <cctype>
#include <string>

namespace GeoKit {
namespace Geohash {

namespace {

struct DecodeFailure {
    GeoErrorCode code;
    size_t position = 0;
};

[[nodiscard]] Bounds WorldBounds() noexcept {
    const auto& geo = Geodetic();
    return Bounds{{geo.minLatitude, geo.maxLatitude}, {geo.minLongitude, geo.maxLongitude}};
}

[[nodiscard]] int SymbolIndex(char c) noexcept {
    return Geodetic().IndexOf(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
}

// Narrow the world bounds by every bit of the geohash, longitude first
[[nodiscard]] std::expected<Bounds, DecodeFailure> Bisect(std::string_view geohash) noexcept {
    if (geohash.empty()) {
        return std::unexpected(DecodeFailure{GeoErrorCode::EmptyInput});
    }

    Bounds bounds = WorldBounds();
    bool evenBit = true;

    for (size_t i = 0; i < geohash.size(); ++i) {
        const int idx = SymbolIndex(geohash[i]);
        if (idx < 0) {
            return std::unexpected(DecodeFailure{GeoErrorCode::InvalidCharacter, i});
        }

        for (int bit = kBitsPerGeohashChar - 1; bit >= 0; --bit) {
            Interval& axis = evenBit ? bounds.longitude : bounds.latitude;
            const double mid = axis.Mid();

            if ((idx >> bit) & 1) {
                axis.min = mid;
            } else {
                axis.max = mid;
            }

            evenBit = !evenBit;
        }
    }

    return bounds;
}

[[noreturn]] void ThrowDecodeFailure(std::string_view geohash, const DecodeFailure& failure) {
    GEOKIT_LOG_DEBUG("Rejected geohash '{}': {}", geohash, GeoErrorCodeToString(failure.code));

    if (failure.code == GeoErrorCode::EmptyInput) {
        throw GeohashError(failure.code, "Geohash must be a non-empty string.");
    }
    throw GeohashError(failure.code,
                       "Invalid geohash character '" + std::string(1, geohash[failure.position]) +
                       "' at position " + std::to_string(failure.position) + " in \"" +
                       std::string(geohash) + "\"");
}

[[noreturn]] void ThrowNullGeohash() {
    GEOKIT_LOG_DEBUG("Rejected null geohash");
    throw GeohashError(GeoErrorCode::InvalidType, "Geohash must be a non-empty string.");
}

} // namespace

std::string Encode(const Coordinate& coordinate, size_t length) {
    const auto& geo = Geodetic();

    std::string geohash;
    geohash.reserve(length);

    Interval lat{geo.minLatitude, geo.maxLatitude};
    Interval lon{geo.minLongitude, geo.maxLongitude};

    int idx = 0;
    int bit = 0;
    bool evenBit = true;

    while (geohash.size() < length) {
        if (evenBit) {
            const double mid = lon.Mid();
            if (coordinate.longitude > mid) {
                idx = idx * 2 + 1;
                lon.min = mid;
            } else {
                idx *= 2;
                lon.max = mid;
            }
        } else {
            const double mid = lat.Mid();
            if (coordinate.latitude > mid) {
                idx = idx * 2 + 1;
                lat.min = mid;
            } else {
                idx *= 2;
                lat.max = mid;
            }
        }

        evenBit = !evenBit;

        if (++bit == kBitsPerGeohashChar) {
            geohash.push_back(geo.base32Alphabet[idx]);
            bit = 0;
            idx = 0;
        }
    }

    return geohash;
}

Coordinate Decode(std::string_view geohash) {
    return DecodeBounds(geohash).Center();
}

Coordinate Decode(const char* geohash) {
    if (geohash == nullptr) {
        ThrowNullGeohash();
    }
    return Decode(std::string_view(geohash));
}

Bounds DecodeBounds(std::string_view geohash) {
    auto bounds = Bisect(geohash);
    if (!bounds) {
        ThrowDecodeFailure(geohash, bounds.error());
    }
    return *bounds;
}

Bounds DecodeBounds(const char* geohash) {
    if (geohash == nullptr) {
        ThrowNullGeohash();
    }
    return DecodeBounds(std::string_view(geohash));
}

std::expected<Bounds, GeoErrorCode> TryDecodeBounds(std::string_view geohash) noexcept {
    auto bounds = Bisect(geohash);
    if (!bounds) {
        return std::unexpected(bounds.error().code);
    }
    return *bounds;
}

std::vector<uint8_t> ToBytes(std::string_view geohash) {
    if (geohash.empty()) {
        ThrowDecodeFailure(geohash, DecodeFailure{GeoErrorCode::EmptyInput});
    }

    std::vector<uint8_t> bytes;
    bytes.reserve(geohash.size());

    for (size_t i = 0; i < geohash.size(); ++i) {
        const int idx = SymbolIndex(geohash[i]);
        if (idx < 0) {
            ThrowDecodeFailure(geohash, DecodeFailure{GeoErrorCode::InvalidCharacter, i});
        }
        bytes.push_back(static_cast<uint8_t>(idx));
    }

    return bytes;
}

std::vector<uint8_t> ToBytes(const char* geohash) {
    if (geohash == nullptr) {
        ThrowNullGeohash();
    }
    return ToBytes(std::string_view(geohash));
}

bool IsValid(std::string_view geohash) noexcept {
    if (geohash.empty()) {
        return false;
    }
    for (char c : geohash) {
        if (SymbolIndex(c) < 0) {
            return false;
        }
    }
    return true;
}

} // namespace Geohash
} // namespace GeoKit
