#pragma once

#include "Types.hpp"
#include "StreamEvent.hpp"
#include "ports/ILocationSensor.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace farmfence {

/**
 * @brief JSON conversion at the edge of the engine
 *
 * Zone and tree documents arrive with inconsistent field names; they are
 * normalized here so nothing past this point branches on source naming.
 *
 * Zone boundary keys: boundary, boundaries, coordinates, polygon, points.
 * Vertex forms: {lat,lng}, {lat,lon}, {latitude,longitude}, [lng, lat].
 */
class JsonCodec {
public:
    static std::optional<GeoPoint> jsonToPoint(const nlohmann::json& json);
    static std::vector<GeoPoint> jsonToBoundary(const nlohmann::json& zone);

    /// @throws std::invalid_argument when the document has no id
    static Zone jsonToZone(const nlohmann::json& json);
    /// @throws std::invalid_argument when the document has no id
    static TreePoint jsonToTree(const nlohmann::json& json);

    /// Accepts an array or an object holding the array under "zones"; bad entries are skipped.
    static std::vector<Zone> jsonToZones(const nlohmann::json& json);
    /// Accepts an array or an object holding the array under "trees"; bad entries are skipped.
    static std::vector<TreePoint> jsonToTrees(const nlohmann::json& json);

    static ports::SensorSample jsonToSample(const nlohmann::json& json);
    /// Present only for entries of the form {"error": "timeout" | "unavailable" | "denied"}.
    static std::optional<ports::SensorError> jsonToSensorError(const nlohmann::json& json);

    static nlohmann::json positionToJson(const Position& position);
    static nlohmann::json zoneToJson(const Zone& zone);
    static nlohmann::json proximityToJson(const ProximityResult& result);
    static nlohmann::json eventToJson(const StreamEvent& event);
    static nlohmann::json sessionToJson(const TrackingSession& session);

    static std::string serialize(const ProximityResult& result);
};

} // namespace farmfence
