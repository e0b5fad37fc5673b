#include "ZoneResolver.hpp"
#include "GeoMath.hpp"
#include <algorithm>

namespace farmfence {

bool ZoneResolver::hasValidBoundary(const Zone& zone) {
    return GeoMath::distinctVertexCount(zone.boundary) >= 3;
}

ZoneResolution ZoneResolver::resolve(const GeoPoint& position, const std::vector<Zone>& zones) {
    ZoneResolution result;
    result.zones.reserve(zones.size());

    const NearbyZone* smallestContaining = nullptr;
    double smallestArea = 0.0;

    for (const auto& zone : zones) {
        if (!zone.isActive) continue;

        if (!hasValidBoundary(zone)) {
            result.rejectedZoneIds.push_back(zone.id);
            continue;
        }
        auto ring = GeoMath::dedupePolygon(zone.boundary);

        NearbyZone entry;
        entry.zone = zone;
        entry.isInside = GeoMath::pointInPolygon(position, ring);
        entry.distanceMeters = entry.isInside
            ? 0.0
            : GeoMath::distanceMeters(position, GeoMath::centroid(ring));
        result.zones.push_back(std::move(entry));
    }

    std::stable_sort(result.zones.begin(), result.zones.end(),
                     [](const NearbyZone& a, const NearbyZone& b) {
                         return a.distanceMeters < b.distanceMeters;
                     });

    // Strict comparison keeps the earliest containing zone on equal area.
    for (const auto& entry : result.zones) {
        if (!entry.isInside) continue;
        double area = GeoMath::polygonAreaSquareMeters(entry.zone.boundary);
        if (!smallestContaining || area < smallestArea) {
            smallestContaining = &entry;
            smallestArea = area;
        }
    }

    if (smallestContaining) {
        result.currentZone = smallestContaining->zone;
    }
    return result;
}

} // namespace farmfence
