/**
 * @file LocationService.hpp
 * @brief Position provider interface
 *
 * Abstracts a platform geolocation service behind a single-shot request.
 * Options are handed to the provider unmodified; the provider resolves
 * once through either the location or the error callback.
 */

#pragma once

#include "location/Coordinate.hpp"

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace GeoKit {
namespace Platform {

/**
 * @brief Location error codes
 */
enum class LocationError {
    None,
    PermissionDenied,
    LocationDisabled,
    NetworkUnavailable,
    Timeout,
    Unknown,
    NotSupported
};

/**
 * @brief Get a readable name for a LocationError
 */
[[nodiscard]] const char* LocationErrorToString(LocationError error) noexcept;

/**
 * @brief Options passed through to the provider
 */
struct PositionOptions {
    bool enableHighAccuracy = false;    ///< Ask for the most precise fix available
    int64_t maximumAgeMs = 0;           ///< Accept a cached fix up to this old (0 = fresh only)
    int64_t timeoutMs = -1;             ///< Give up after this long (-1 = wait forever)
};

/**
 * @brief Position fix returned by a provider
 */
struct LocationData {
    Coordinate coordinate;      ///< Position, with accuracy in meters when known
    int64_t timestamp = 0;      ///< Unix timestamp in milliseconds
    std::string provider;       ///< Name of the service that produced the fix

    [[nodiscard]] bool IsValid() const noexcept { return coordinate.IsValid(); }
};

/**
 * @brief Provider failure delivered through a position future
 */
class PositionError : public std::runtime_error {
public:
    PositionError(LocationError error, const std::string& message)
        : std::runtime_error(message), m_error(error) {}

    [[nodiscard]] LocationError GetError() const noexcept { return m_error; }

private:
    LocationError m_error;
};

// Callback type definitions
using LocationCallback = std::function<void(const LocationData& location)>;
using LocationErrorCallback = std::function<void(LocationError error, const std::string& message)>;

/**
 * @brief Position provider interface
 *
 * Implementations:
 * - StaticLocationService (fixed or scripted position)
 */
class ILocationService {
public:
    virtual ~ILocationService() = default;

    /**
     * @brief Request a single location update
     *
     * Exactly one of the callbacks is expected to be invoked, possibly on
     * another thread and possibly before this call returns.
     *
     * @param options Passed through to the platform unmodified
     * @param callback Called with location result
     * @param errorCallback Called on error
     */
    virtual void RequestSingleUpdate(const PositionOptions& options,
                                     LocationCallback callback,
                                     LocationErrorCallback errorCallback) = 0;

    /**
     * @brief Get platform-specific location service name
     */
    [[nodiscard]] virtual std::string GetServiceName() const = 0;
};

} // namespace Platform
} // namespace GeoKit
