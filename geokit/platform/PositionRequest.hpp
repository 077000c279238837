/**
 * @file PositionRequest.hpp
 * @brief One-shot position requests as futures
 */

#pragma once

#include "platform/LocationService.hpp"

#include <future>
#include <string>

namespace GeoKit {
namespace Platform {

/**
 * @brief Issue a single position request
 *
 * The returned future holds the first outcome the provider reports; a
 * later callback for the same request is ignored. Provider failures
 * surface as PositionError from future::get().
 */
[[nodiscard]] std::future<LocationData> RequestPosition(ILocationService& service,
                                                        const PositionOptions& options = {});

/**
 * @brief Request a position and encode it as a geohash
 *
 * The geohash length follows the accuracy reported with the fix (or the
 * precision implied by its latitude when none is reported).
 *
 * @throws PositionError (from get()) when the provider fails
 * @throws CoordinateRangeError (from get()) when the provider reports an impossible position
 */
[[nodiscard]] std::future<std::string> GetCurrentPositionHash(ILocationService& service,
                                                              const PositionOptions& options = {});

} // namespace Platform
} // namespace GeoKit
