#pragma once

#include "Types.hpp"
#include <cstddef>
#include <vector>

namespace farmfence {

/**
 * @brief Stateless geodesy helpers for farm-scale geometry
 *
 * Distances use the haversine great-circle formula on a spherical Earth.
 * Area and centroid use an equirectangular projection and are only meant
 * for polygons spanning tens to a few hundred meters.
 */
class GeoMath {
public:
    static constexpr double EARTH_RADIUS_METERS = 6371000.0;

    static double distanceMeters(double lat1, double lon1, double lat2, double lon2);
    static double distanceMeters(const GeoPoint& a, const GeoPoint& b);

    /// Initial bearing from a to b, degrees clockwise from north in [0, 360).
    static double bearingDegrees(const GeoPoint& a, const GeoPoint& b);

    /**
     * @brief Return a copy of the ring with the first vertex appended when open
     * @return Closed ring, or an empty vector when fewer than 3 vertices are given
     */
    static std::vector<GeoPoint> closePolygon(const std::vector<GeoPoint>& boundary);

    /**
     * @brief Drop consecutive repeated vertices and the closing vertex
     * @return Open ring of distinct consecutive vertices
     */
    static std::vector<GeoPoint> dedupePolygon(const std::vector<GeoPoint>& boundary);

    /// Number of distinct vertices anywhere in the ring, not only between neighbours.
    static size_t distinctVertexCount(const std::vector<GeoPoint>& boundary);

    /// Shoelace area over an equirectangular projection anchored at the mean latitude.
    static double polygonAreaSquareMeters(const std::vector<GeoPoint>& boundary);

    /// polygonAreaSquareMeters in hectares, rounded to 2 decimals.
    static double polygonAreaHectares(const std::vector<GeoPoint>& boundary);

    /**
     * @brief Even-odd ray casting test against the implicitly closed ring
     * @note Self-intersecting rings yield the even-odd answer, not a geometric one
     */
    static bool pointInPolygon(const GeoPoint& point, const std::vector<GeoPoint>& boundary);

    /// Arithmetic mean of the distinct vertices (not the area centroid).
    static GeoPoint centroid(const std::vector<GeoPoint>& boundary);

    /// Range-checked, and rejects the (0, 0) placeholder used for missing coordinates.
    static bool isValidCoordinate(double lat, double lon);

private:
    static double toRadians(double degrees);
    static double toDegrees(double radians);
};

} // namespace farmfence
