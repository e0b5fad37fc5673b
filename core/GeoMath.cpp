#include "GeoMath.hpp"
#include <algorithm>
#include <cmath>

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

namespace farmfence {

double GeoMath::distanceMeters(double lat1, double lon1, double lat2, double lon2) {
    double dLat = toRadians(lat2 - lat1);
    double dLon = toRadians(lon2 - lon1);

    double h = std::sin(dLat/2) * std::sin(dLat/2) +
               std::cos(toRadians(lat1)) * std::cos(toRadians(lat2)) *
               std::sin(dLon/2) * std::sin(dLon/2);

    double c = 2 * std::atan2(std::sqrt(h), std::sqrt(1-h));
    return EARTH_RADIUS_METERS * c;
}

double GeoMath::distanceMeters(const GeoPoint& a, const GeoPoint& b) {
    return distanceMeters(a.lat, a.lon, b.lat, b.lon);
}

double GeoMath::bearingDegrees(const GeoPoint& a, const GeoPoint& b) {
    double dLon = toRadians(b.lon - a.lon);
    double y = std::sin(dLon) * std::cos(toRadians(b.lat));
    double x = std::cos(toRadians(a.lat)) * std::sin(toRadians(b.lat)) -
               std::sin(toRadians(a.lat)) * std::cos(toRadians(b.lat)) * std::cos(dLon);

    double bearing = toDegrees(std::atan2(y, x));
    return std::fmod(bearing + 360.0, 360.0);
}

std::vector<GeoPoint> GeoMath::closePolygon(const std::vector<GeoPoint>& boundary) {
    if (boundary.size() < 3) {
        return {};
    }

    std::vector<GeoPoint> ring = boundary;
    if (ring.front() != ring.back()) {
        ring.push_back(ring.front());
    }
    return ring;
}

std::vector<GeoPoint> GeoMath::dedupePolygon(const std::vector<GeoPoint>& boundary) {
    std::vector<GeoPoint> ring;
    ring.reserve(boundary.size());

    for (const auto& vertex : boundary) {
        if (ring.empty() || ring.back() != vertex) {
            ring.push_back(vertex);
        }
    }

    while (ring.size() > 1 && ring.front() == ring.back()) {
        ring.pop_back();
    }
    return ring;
}

size_t GeoMath::distinctVertexCount(const std::vector<GeoPoint>& boundary) {
    std::vector<GeoPoint> vertices = boundary;
    std::sort(vertices.begin(), vertices.end(), [](const GeoPoint& a, const GeoPoint& b) {
        return a.lat < b.lat || (a.lat == b.lat && a.lon < b.lon);
    });
    return static_cast<size_t>(std::unique(vertices.begin(), vertices.end()) - vertices.begin());
}

double GeoMath::polygonAreaSquareMeters(const std::vector<GeoPoint>& boundary) {
    auto vertices = dedupePolygon(boundary);
    if (vertices.size() < 3) {
        return 0.0;
    }

    double lat0 = 0.0;
    for (const auto& v : vertices) {
        lat0 += v.lat;
    }
    lat0 /= static_cast<double>(vertices.size());

    const double metersPerDegree = M_PI / 180.0 * EARTH_RADIUS_METERS;
    const double lonScale = metersPerDegree * std::cos(toRadians(lat0));

    auto ring = closePolygon(vertices);
    double twiceArea = 0.0;
    for (size_t i = 0; i + 1 < ring.size(); ++i) {
        double xi = ring[i].lon * lonScale;
        double yi = ring[i].lat * metersPerDegree;
        double xn = ring[i + 1].lon * lonScale;
        double yn = ring[i + 1].lat * metersPerDegree;
        twiceArea += xi * yn - xn * yi;
    }

    return std::abs(twiceArea) / 2.0;
}

double GeoMath::polygonAreaHectares(const std::vector<GeoPoint>& boundary) {
    double hectares = polygonAreaSquareMeters(boundary) / 10000.0;
    return std::round(hectares * 100.0) / 100.0;
}

bool GeoMath::pointInPolygon(const GeoPoint& point, const std::vector<GeoPoint>& boundary) {
    auto ring = closePolygon(boundary);
    if (ring.empty()) {
        return false;
    }

    const double x = point.lon;
    const double y = point.lat;
    bool inside = false;

    for (size_t i = 0, j = ring.size() - 1; i < ring.size(); j = i++) {
        double xi = ring[i].lon;
        double yi = ring[i].lat;
        double xj = ring[j].lon;
        double yj = ring[j].lat;

        if (((yi > y) != (yj > y)) && (x < (xj - xi) * (y - yi) / (yj - yi) + xi)) {
            inside = !inside;
        }
    }

    return inside;
}

GeoPoint GeoMath::centroid(const std::vector<GeoPoint>& boundary) {
    auto vertices = dedupePolygon(boundary);
    if (vertices.empty()) {
        return GeoPoint{};
    }

    GeoPoint sum;
    for (const auto& v : vertices) {
        sum.lat += v.lat;
        sum.lon += v.lon;
    }
    double n = static_cast<double>(vertices.size());
    return {sum.lat / n, sum.lon / n};
}

bool GeoMath::isValidCoordinate(double lat, double lon) {
    if (!std::isfinite(lat) || !std::isfinite(lon)) {
        return false;
    }
    if (lat == 0.0 || lon == 0.0) {
        return false;
    }
    return lat >= -90.0 && lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
}

double GeoMath::toRadians(double degrees) {
    return degrees * M_PI / 180.0;
}

double GeoMath::toDegrees(double radians) {
    return radians * 180.0 / M_PI;
}

} // namespace farmfence
