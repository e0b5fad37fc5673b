#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace farmfence {

struct GeoPoint {
    double lat = 0.0;
    double lon = 0.0;

    bool operator==(const GeoPoint& other) const {
        return lat == other.lat && lon == other.lon;
    }
    bool operator!=(const GeoPoint& other) const { return !(*this == other); }
};

enum class PermissionState {
    Unknown,
    Prompt,
    Granted,
    Denied
};

enum class TrackingState {
    Idle,
    Requesting,
    Active,
    Error
};

enum class ErrorKind {
    PermissionDenied,
    PositionUnavailable,
    Timeout,
    Unsupported
};

struct Position {
    double latitude = 0.0;
    double longitude = 0.0;
    double accuracyMeters = 0.0;
    std::optional<double> headingDegrees;
    std::optional<double> speedMps;
    uint64_t timestampMs = 0;

    GeoPoint point() const { return {latitude, longitude}; }
};

struct TrackingPoint {
    double latitude = 0.0;
    double longitude = 0.0;
    uint64_t timestampMs = 0;
};

struct Zone {
    std::string id;
    std::string name;
    std::vector<GeoPoint> boundary;   ///< As stored by the data layer, possibly unclosed
    std::string color;
    bool isActive = true;

    double areaHectares() const;
};

struct TreePoint {
    std::string id;
    double latitude = 0.0;
    double longitude = 0.0;

    GeoPoint point() const { return {latitude, longitude}; }
};

struct NearbyTree {
    TreePoint tree;
    double distanceMeters = 0.0;
    double bearingDegrees = 0.0;
};

struct NearbyZone {
    Zone zone;
    double distanceMeters = 0.0;
    bool isInside = false;
};

struct ProximityResult {
    std::vector<NearbyTree> nearbyTrees;   ///< Ascending by distance
    std::vector<NearbyZone> nearbyZones;   ///< Ascending by distance, containing zones first
    std::optional<Zone> currentZone;

    bool empty() const {
        return nearbyTrees.empty() && nearbyZones.empty() && !currentZone;
    }
};

/// Running statistics for one startTracking/stopTracking session.
struct TrackingSession {
    uint64_t startedAtMs = 0;
    uint64_t endedAtMs = 0;
    double totalDistanceMeters = 0.0;
    double averageAccuracyMeters = 0.0;
    uint64_t sampleCount = 0;
    std::vector<std::string> zonesVisited;
    bool active = false;
};

std::string permissionStateToString(PermissionState state);
std::string trackingStateToString(TrackingState state);
std::string errorKindToString(ErrorKind kind);
ErrorKind stringToErrorKind(const std::string& str);

} // namespace farmfence
