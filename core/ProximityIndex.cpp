#include "ProximityIndex.hpp"
#include "GeoMath.hpp"
#include "ZoneResolver.hpp"
#include <algorithm>

namespace farmfence {

ProximityResult ProximityIndex::compute(const std::optional<Position>& position,
                                        double radiusMeters,
                                        const std::vector<TreePoint>& trees,
                                        const std::vector<Zone>& zones) {
    ProximityResult result;
    if (!position) {
        return result;
    }

    const GeoPoint here = position->point();
    result.nearbyTrees = nearbyTrees(here, radiusMeters, trees);

    auto resolution = ZoneResolver::resolve(here, zones);
    for (auto& entry : resolution.zones) {
        if (entry.isInside || entry.distanceMeters <= radiusMeters) {
            result.nearbyZones.push_back(std::move(entry));
        }
    }
    result.currentZone = std::move(resolution.currentZone);
    return result;
}

std::vector<NearbyTree> ProximityIndex::nearbyTrees(const GeoPoint& position,
                                                    double radiusMeters,
                                                    const std::vector<TreePoint>& trees) {
    std::vector<NearbyTree> nearby;

    for (const auto& tree : trees) {
        if (!GeoMath::isValidCoordinate(tree.latitude, tree.longitude)) continue;

        double distance = GeoMath::distanceMeters(position, tree.point());
        if (distance > radiusMeters) continue;

        NearbyTree entry;
        entry.tree = tree;
        entry.distanceMeters = distance;
        entry.bearingDegrees = GeoMath::bearingDegrees(position, tree.point());
        nearby.push_back(std::move(entry));
    }

    std::stable_sort(nearby.begin(), nearby.end(),
                     [](const NearbyTree& a, const NearbyTree& b) {
                         return a.distanceMeters < b.distanceMeters;
                     });
    return nearby;
}

} // namespace farmfence
