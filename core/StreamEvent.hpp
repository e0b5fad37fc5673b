#pragma once

#include "Types.hpp"
#include <string>
#include <variant>

namespace farmfence {

enum class StreamEventType {
    Position,
    PermissionChanged,
    TrackingError,
    Geofence
};

enum class GeofenceTransition {
    Enter,
    Exit
};

struct PositionEvent {
    Position position;
};

struct PermissionChangedEvent {
    PermissionState state = PermissionState::Unknown;
};

struct TrackingErrorEvent {
    ErrorKind kind = ErrorKind::PositionUnavailable;
    std::string message;
};

struct GeofenceEvent {
    GeofenceTransition transition = GeofenceTransition::Enter;
    std::string zoneId;
    std::string zoneName;
    Position position;
};

/// Everything a PositionStream consumer can observe, one alternative per StreamEventType.
using StreamEvent = std::variant<PositionEvent, PermissionChangedEvent, TrackingErrorEvent, GeofenceEvent>;

StreamEventType eventTypeOf(const StreamEvent& event);

std::string eventTypeToString(StreamEventType type);
std::string geofenceTransitionToString(GeofenceTransition transition);

} // namespace farmfence
