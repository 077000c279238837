/**
 * @file StaticLocationService.hpp
 * @brief Position provider that reports a fixed, manually set position
 */

#pragma once

#include "platform/LocationService.hpp"

#include <mutex>
#include <optional>
#include <string>

namespace GeoKit {
namespace Platform {

/**
 * @brief Manual position provider for simulation and tests
 *
 * Answers every request synchronously with the position last passed to
 * SetLocation(), or with the scripted failure when one is set. A request
 * made before any position was set fails with LocationError::LocationDisabled.
 */
class StaticLocationService : public ILocationService {
public:
    static constexpr const char* kServiceName = "Static";

    StaticLocationService() = default;
    explicit StaticLocationService(const Coordinate& coordinate);

    StaticLocationService(const StaticLocationService&) = delete;
    StaticLocationService& operator=(const StaticLocationService&) = delete;

    // === Manual Position ===

    /**
     * @brief Set current location manually (timestamped now)
     */
    void SetLocation(const Coordinate& coordinate);

    /**
     * @brief Set full location data
     */
    void SetLocation(const LocationData& location);

    /**
     * @brief Make every following request fail with the given error
     */
    void SetFailure(LocationError error, const std::string& message);

    void ClearFailure();

    // === ILocationService ===

    void RequestSingleUpdate(const PositionOptions& options,
                             LocationCallback callback,
                             LocationErrorCallback errorCallback) override;

    [[nodiscard]] std::string GetServiceName() const override { return kServiceName; }

    // === Inspection ===

    [[nodiscard]] size_t GetRequestCount() const;

    /**
     * @brief Options received by the most recent request
     */
    [[nodiscard]] std::optional<PositionOptions> GetLastOptions() const;

private:
    struct Failure {
        LocationError error;
        std::string message;
    };

    mutable std::mutex m_mutex;
    std::optional<LocationData> m_location;
    std::optional<Failure> m_failure;
    std::optional<PositionOptions> m_lastOptions;
    size_t m_requestCount = 0;
};

} // namespace Platform
} // namespace GeoKit
