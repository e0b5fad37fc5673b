#pragma once

#include "Types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace farmfence {

struct ZoneResolution {
    std::vector<NearbyZone> zones;              ///< Every evaluated zone, ascending by distance
    std::optional<Zone> currentZone;
    std::vector<std::string> rejectedZoneIds;   ///< Fewer than 3 distinct vertices
};

/**
 * @brief Resolves containment and distance of a position against zone polygons
 *
 * A containing zone has distance 0. Any other zone is measured to the mean of
 * its vertices. Inactive zones are skipped and zones with degenerate
 * boundaries are reported in rejectedZoneIds instead of being evaluated.
 *
 * When several zones contain the position the current zone is the one with
 * the smallest area, first in input order on equal area.
 */
class ZoneResolver {
public:
    static ZoneResolution resolve(const GeoPoint& position, const std::vector<Zone>& zones);

    static bool hasValidBoundary(const Zone& zone);
};

} // namespace farmfence
