#include "JsonCodec.hpp"
#include <initializer_list>
#include <iostream>
#include <stdexcept>

namespace farmfence {

namespace {

const nlohmann::json* findField(const nlohmann::json& json, std::initializer_list<const char*> keys) {
    if (!json.is_object()) return nullptr;
    for (const char* key : keys) {
        auto it = json.find(key);
        if (it != json.end() && !it->is_null()) {
            return &*it;
        }
    }
    return nullptr;
}

std::optional<double> numberField(const nlohmann::json& json, std::initializer_list<const char*> keys) {
    const nlohmann::json* field = findField(json, keys);
    if (!field || !field->is_number()) return std::nullopt;
    return field->get<double>();
}

std::string idField(const nlohmann::json& json, std::initializer_list<const char*> keys) {
    const nlohmann::json* field = findField(json, keys);
    if (!field) return "";
    if (field->is_string()) return field->get<std::string>();
    if (field->is_number_integer()) return std::to_string(field->get<long long>());
    return "";
}

nlohmann::json optionalToJson(const std::optional<double>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

struct EventJsonVisitor {
    nlohmann::json operator()(const PositionEvent& e) const {
        nlohmann::json j;
        j["type"] = eventTypeToString(StreamEventType::Position);
        j["position"] = JsonCodec::positionToJson(e.position);
        return j;
    }
    nlohmann::json operator()(const PermissionChangedEvent& e) const {
        nlohmann::json j;
        j["type"] = eventTypeToString(StreamEventType::PermissionChanged);
        j["state"] = permissionStateToString(e.state);
        return j;
    }
    nlohmann::json operator()(const TrackingErrorEvent& e) const {
        nlohmann::json j;
        j["type"] = eventTypeToString(StreamEventType::TrackingError);
        j["kind"] = errorKindToString(e.kind);
        j["message"] = e.message;
        return j;
    }
    nlohmann::json operator()(const GeofenceEvent& e) const {
        nlohmann::json j;
        j["type"] = eventTypeToString(StreamEventType::Geofence);
        j["transition"] = geofenceTransitionToString(e.transition);
        j["zoneId"] = e.zoneId;
        j["zoneName"] = e.zoneName;
        j["position"] = JsonCodec::positionToJson(e.position);
        return j;
    }
};

} // anonymous namespace

std::optional<GeoPoint> JsonCodec::jsonToPoint(const nlohmann::json& json) {
    if (json.is_array()) {
        // GeoJSON order
        if (json.size() < 2 || !json[0].is_number() || !json[1].is_number()) {
            return std::nullopt;
        }
        return GeoPoint{json[1].get<double>(), json[0].get<double>()};
    }

    auto lat = numberField(json, {"lat", "latitude"});
    auto lon = numberField(json, {"lng", "lon", "longitude"});
    if (!lat || !lon) {
        return std::nullopt;
    }
    return GeoPoint{*lat, *lon};
}

std::vector<GeoPoint> JsonCodec::jsonToBoundary(const nlohmann::json& zone) {
    std::vector<GeoPoint> boundary;

    const nlohmann::json* field = findField(zone, {"boundary", "boundaries", "coordinates", "polygon", "points"});
    if (!field || !field->is_array()) {
        return boundary;
    }

    // GeoJSON polygons nest the outer ring one level deeper
    const nlohmann::json* ring = field;
    if (!field->empty() && (*field)[0].is_array() && !(*field)[0].empty() && (*field)[0][0].is_array()) {
        ring = &(*field)[0];
    }

    for (const auto& vertex : *ring) {
        auto point = jsonToPoint(vertex);
        if (point) {
            boundary.push_back(*point);
        }
    }
    return boundary;
}

Zone JsonCodec::jsonToZone(const nlohmann::json& json) {
    Zone zone;
    zone.id = idField(json, {"id", "zoneId"});
    if (zone.id.empty()) {
        throw std::invalid_argument("zone document has no id");
    }

    const nlohmann::json* name = findField(json, {"name"});
    zone.name = (name && name->is_string()) ? name->get<std::string>() : zone.id;

    const nlohmann::json* color = findField(json, {"color"});
    zone.color = (color && color->is_string()) ? color->get<std::string>() : "";

    const nlohmann::json* active = findField(json, {"isActive", "active"});
    zone.isActive = (active && active->is_boolean()) ? active->get<bool>() : true;

    zone.boundary = jsonToBoundary(json);
    return zone;
}

TreePoint JsonCodec::jsonToTree(const nlohmann::json& json) {
    TreePoint tree;
    tree.id = idField(json, {"id", "treeId"});
    if (tree.id.empty()) {
        throw std::invalid_argument("tree document has no id");
    }

    auto lat = numberField(json, {"latitude", "lat", "currentLatitude"});
    auto lon = numberField(json, {"longitude", "lng", "lon", "currentLongitude"});

    if (!lat || !lon) {
        const nlohmann::json* nested = findField(json, {"location", "coordinates", "position"});
        if (nested) {
            auto point = jsonToPoint(*nested);
            if (point) {
                lat = point->lat;
                lon = point->lon;
            }
        }
    }

    // Missing coordinates stay at 0 and are excluded by the proximity filter
    tree.latitude = lat.value_or(0.0);
    tree.longitude = lon.value_or(0.0);
    return tree;
}

std::vector<Zone> JsonCodec::jsonToZones(const nlohmann::json& json) {
    const nlohmann::json& list = (json.is_object() && json.contains("zones")) ? json["zones"] : json;

    std::vector<Zone> zones;
    if (!list.is_array()) {
        std::cerr << "[JsonCodec] Zone snapshot is not an array" << std::endl;
        return zones;
    }

    for (const auto& entry : list) {
        try {
            zones.push_back(jsonToZone(entry));
        } catch (const std::exception& e) {
            std::cerr << "[JsonCodec] Skipping zone: " << e.what() << std::endl;
        }
    }
    return zones;
}

std::vector<TreePoint> JsonCodec::jsonToTrees(const nlohmann::json& json) {
    const nlohmann::json& list = (json.is_object() && json.contains("trees")) ? json["trees"] : json;

    std::vector<TreePoint> trees;
    if (!list.is_array()) {
        std::cerr << "[JsonCodec] Tree snapshot is not an array" << std::endl;
        return trees;
    }

    for (const auto& entry : list) {
        try {
            trees.push_back(jsonToTree(entry));
        } catch (const std::exception& e) {
            std::cerr << "[JsonCodec] Skipping tree: " << e.what() << std::endl;
        }
    }
    return trees;
}

ports::SensorSample JsonCodec::jsonToSample(const nlohmann::json& json) {
    ports::SensorSample sample;

    auto point = jsonToPoint(json);
    if (point) {
        sample.latitude = point->lat;
        sample.longitude = point->lon;
    }

    sample.accuracyMeters = numberField(json, {"accuracy", "acc", "accuracyMeters"}).value_or(0.0);
    sample.headingDegrees = numberField(json, {"heading", "headingDegrees"});
    sample.speedMps = numberField(json, {"speed", "speedMps"});

    const nlohmann::json* ts = findField(json, {"timestamp", "ts", "timestampMs"});
    if (ts && ts->is_number()) {
        sample.timestampMs = ts->get<uint64_t>();
    }
    return sample;
}

std::optional<ports::SensorError> JsonCodec::jsonToSensorError(const nlohmann::json& json) {
    const nlohmann::json* field = findField(json, {"error"});
    if (!field || !field->is_string()) {
        return std::nullopt;
    }

    ports::SensorError error;
    switch (stringToErrorKind(field->get<std::string>())) {
        case ErrorKind::PermissionDenied:
            error.code = ports::SensorErrorCode::PermissionDenied;
            break;
        case ErrorKind::Timeout:
            error.code = ports::SensorErrorCode::Timeout;
            break;
        default:
            error.code = ports::SensorErrorCode::PositionUnavailable;
            break;
    }
    error.message = json.value("message", field->get<std::string>());
    return error;
}

nlohmann::json JsonCodec::positionToJson(const Position& position) {
    nlohmann::json j;
    j["lat"] = position.latitude;
    j["lng"] = position.longitude;
    j["accuracy"] = position.accuracyMeters;
    j["heading"] = optionalToJson(position.headingDegrees);
    j["speed"] = optionalToJson(position.speedMps);
    j["timestamp"] = position.timestampMs;
    return j;
}

nlohmann::json JsonCodec::zoneToJson(const Zone& zone) {
    nlohmann::json j;
    j["id"] = zone.id;
    j["name"] = zone.name;
    j["color"] = zone.color;
    j["isActive"] = zone.isActive;
    j["areaHectares"] = zone.areaHectares();

    nlohmann::json boundary = nlohmann::json::array();
    for (const auto& vertex : zone.boundary) {
        boundary.push_back({{"lat", vertex.lat}, {"lng", vertex.lon}});
    }
    j["boundary"] = boundary;
    return j;
}

nlohmann::json JsonCodec::proximityToJson(const ProximityResult& result) {
    nlohmann::json j;

    nlohmann::json trees = nlohmann::json::array();
    for (const auto& entry : result.nearbyTrees) {
        trees.push_back({
            {"id", entry.tree.id},
            {"distanceMeters", entry.distanceMeters},
            {"bearingDegrees", entry.bearingDegrees}
        });
    }
    j["nearbyTrees"] = trees;

    nlohmann::json zones = nlohmann::json::array();
    for (const auto& entry : result.nearbyZones) {
        zones.push_back({
            {"id", entry.zone.id},
            {"name", entry.zone.name},
            {"distanceMeters", entry.distanceMeters},
            {"isInside", entry.isInside},
            {"areaHectares", entry.zone.areaHectares()}
        });
    }
    j["nearbyZones"] = zones;

    j["currentZone"] = result.currentZone ? nlohmann::json(result.currentZone->id) : nlohmann::json(nullptr);
    return j;
}

nlohmann::json JsonCodec::eventToJson(const StreamEvent& event) {
    return std::visit(EventJsonVisitor{}, event);
}

nlohmann::json JsonCodec::sessionToJson(const TrackingSession& session) {
    nlohmann::json j;
    j["startedAt"] = session.startedAtMs;
    j["endedAt"] = session.endedAtMs;
    j["totalDistanceMeters"] = session.totalDistanceMeters;
    j["averageAccuracyMeters"] = session.averageAccuracyMeters;
    j["sampleCount"] = session.sampleCount;
    j["zonesVisited"] = session.zonesVisited;
    j["active"] = session.active;
    return j;
}

std::string JsonCodec::serialize(const ProximityResult& result) {
    return proximityToJson(result).dump();
}

} // namespace farmfence
