#pragma once

#include "Types.hpp"
#include <optional>
#include <vector>

namespace farmfence {

/**
 * @brief Derives the "nearby" view for a field worker from one position
 *
 * Pure function of its inputs; holds no state between calls and never
 * mutates the snapshots it is given. Without a fix the result is empty.
 */
class ProximityIndex {
public:
    static constexpr double DEFAULT_RADIUS_METERS = 30.0;

    static ProximityResult compute(const std::optional<Position>& position,
                                   double radiusMeters,
                                   const std::vector<TreePoint>& trees,
                                   const std::vector<Zone>& zones);

    /// Trees with usable coordinates within radiusMeters, ascending by distance.
    static std::vector<NearbyTree> nearbyTrees(const GeoPoint& position,
                                               double radiusMeters,
                                               const std::vector<TreePoint>& trees);
};

} // namespace farmfence
