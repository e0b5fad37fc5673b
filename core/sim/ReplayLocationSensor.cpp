#include "ReplayLocationSensor.hpp"
#include "../JsonCodec.hpp"

namespace farmfence::sim {

ReplayLocationSensor::ReplayLocationSensor(std::vector<TrackEntry> track)
    : track_(std::move(track)) {
    for (const auto& entry : track_) {
        if (entry.error && entry.error->code == ports::SensorErrorCode::PermissionDenied) {
            denyPermission();
            break;
        }
        if (entry.sample) {
            ports::SensorReading reading;
            reading.sample = entry.sample;
            setDefaultReading(reading);
            break;
        }
    }
}

std::vector<TrackEntry> ReplayLocationSensor::parseTrack(const nlohmann::json& json) {
    std::vector<TrackEntry> track;
    if (!json.is_array()) {
        return track;
    }

    for (const auto& item : json) {
        TrackEntry entry;
        entry.error = JsonCodec::jsonToSensorError(item);
        if (!entry.error) {
            entry.sample = JsonCodec::jsonToSample(item);
        }
        track.push_back(std::move(entry));
    }
    return track;
}

bool ReplayLocationSensor::replayNext() {
    if (cursor_ >= track_.size()) {
        return false;
    }

    const TrackEntry& entry = track_[cursor_++];
    if (entry.error) {
        emitError(entry.error->code, entry.error->message);
    } else if (entry.sample) {
        emitSample(*entry.sample);
    }
    return true;
}

} // namespace farmfence::sim
