#include "core/GeoError.hpp"

namespace GeoKit {

std::string_view GeoErrorCodeToString(GeoErrorCode code) noexcept {
    switch (code) {
        case GeoErrorCode::InvalidType:      return "invalid_type";
        case GeoErrorCode::EmptyInput:       return "empty_input";
        case GeoErrorCode::InvalidCharacter: return "invalid_character";
        case GeoErrorCode::OutOfRange:       return "out_of_range";
        case GeoErrorCode::InvalidFormat:    return "invalid_format";
        case GeoErrorCode::InvalidScheme:    return "invalid_scheme";
    }
    return "unknown";
}

} // namespace GeoKit
