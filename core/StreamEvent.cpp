#include "StreamEvent.hpp"
#include <unordered_map>

namespace farmfence {

namespace {

struct EventTypeVisitor {
    StreamEventType operator()(const PositionEvent&) const { return StreamEventType::Position; }
    StreamEventType operator()(const PermissionChangedEvent&) const { return StreamEventType::PermissionChanged; }
    StreamEventType operator()(const TrackingErrorEvent&) const { return StreamEventType::TrackingError; }
    StreamEventType operator()(const GeofenceEvent&) const { return StreamEventType::Geofence; }
};

} // anonymous namespace

StreamEventType eventTypeOf(const StreamEvent& event) {
    return std::visit(EventTypeVisitor{}, event);
}

std::string eventTypeToString(StreamEventType type) {
    static const std::unordered_map<StreamEventType, std::string> typeMap = {
        {StreamEventType::Position, "position"},
        {StreamEventType::PermissionChanged, "permission_changed"},
        {StreamEventType::TrackingError, "tracking_error"},
        {StreamEventType::Geofence, "geofence"}
    };
    
    auto it = typeMap.find(type);
    return (it != typeMap.end()) ? it->second : "unknown";
}

std::string geofenceTransitionToString(GeofenceTransition transition) {
    return transition == GeofenceTransition::Enter ? "enter" : "exit";
}

} // namespace farmfence
