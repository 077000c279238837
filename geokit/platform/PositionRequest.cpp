#include "platform/PositionRequest.hpp"
#include "core/Logger.hpp"
#include "geohash/Geohash.hpp"
#include "location/Accuracy.hpp"

#include <atomic>
#include <memory>

namespace GeoKit {
namespace Platform {

namespace {

struct PendingRequest {
    std::promise<LocationData> promise;
    std::atomic<bool> settled{false};

    // Returns true for the first caller only
    bool Settle() { return !settled.exchange(true); }
};

} // namespace

std::future<LocationData> RequestPosition(ILocationService& service, const PositionOptions& options) {
    auto pending = std::make_shared<PendingRequest>();
    auto future = pending->promise.get_future();

    GEOKIT_LOG_TRACE("Requesting position from {} (highAccuracy={}, maximumAge={}ms, timeout={}ms)",
                     service.GetServiceName(), options.enableHighAccuracy,
                     options.maximumAgeMs, options.timeoutMs);

    service.RequestSingleUpdate(
        options,
        [pending](const LocationData& location) {
            if (pending->Settle()) {
                pending->promise.set_value(location);
            }
        },
        [pending](LocationError error, const std::string& message) {
            if (!pending->Settle()) {
                return;
            }
            GEOKIT_LOG_WARN("Position request failed ({}): {}", LocationErrorToString(error), message);
            pending->promise.set_exception(std::make_exception_ptr(PositionError(error, message)));
        });

    return future;
}

std::future<std::string> GetCurrentPositionHash(ILocationService& service, const PositionOptions& options) {
    return std::async(std::launch::deferred, [position = RequestPosition(service, options)]() mutable {
        const LocationData location = position.get();
        Location::ValidateCoordinate(location.coordinate);

        const double accuracy = Location::EstimateCoordinateAccuracy(location.coordinate);
        const size_t length = Location::CalculateGeohashLength(accuracy).value_or(kDefaultGeohashLength);

        return Geohash::Encode(location.coordinate, length);
    });
}

} // namespace Platform
} // namespace GeoKit
