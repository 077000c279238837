#include "platform/LocationService.hpp"

namespace GeoKit {
namespace Platform {

const char* LocationErrorToString(LocationError error) noexcept {
    switch (error) {
        case LocationError::None: return "none";
        case LocationError::PermissionDenied: return "permission_denied";
        case LocationError::LocationDisabled: return "location_disabled";
        case LocationError::NetworkUnavailable: return "network_unavailable";
        case LocationError::Timeout: return "timeout";
        case LocationError::NotSupported: return "not_supported";
        case LocationError::Unknown: break;
    }
    return "unknown";
}

} // namespace Platform
} // namespace GeoKit
