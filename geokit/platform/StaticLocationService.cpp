#include "platform/StaticLocationService.hpp"
#include "core/Logger.hpp"

#include <chrono>

namespace GeoKit {
namespace Platform {

namespace {

int64_t NowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

StaticLocationService::StaticLocationService(const Coordinate& coordinate) {
    SetLocation(coordinate);
}

void StaticLocationService::SetLocation(const Coordinate& coordinate) {
    LocationData location;
    location.coordinate = coordinate;
    location.timestamp = NowMs();
    SetLocation(location);
}

void StaticLocationService::SetLocation(const LocationData& location) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_location = location;
    m_location->provider = kServiceName;
}

void StaticLocationService::SetFailure(LocationError error, const std::string& message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failure = Failure{error, message};
}

void StaticLocationService::ClearFailure() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failure.reset();
}

void StaticLocationService::RequestSingleUpdate(const PositionOptions& options,
                                                LocationCallback callback,
                                                LocationErrorCallback errorCallback) {
    std::optional<LocationData> location;
    std::optional<Failure> failure;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_requestCount;
        m_lastOptions = options;
        location = m_location;
        failure = m_failure;
    }

    // Callbacks run outside the lock so they may call back into the service
    if (!failure && !location) {
        failure = Failure{LocationError::LocationDisabled, "No position has been set"};
    }

    if (failure) {
        GEOKIT_LOG_DEBUG("Static location request failed: {}", failure->message);
        if (errorCallback) {
            errorCallback(failure->error, failure->message);
        }
        return;
    }

    if (callback) {
        callback(*location);
    }
}

size_t StaticLocationService::GetRequestCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_requestCount;
}

std::optional<PositionOptions> StaticLocationService::GetLastOptions() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lastOptions;
}

} // namespace Platform
} // namespace GeoKit
