#pragma once

#include "MockLocationSensor.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <vector>

namespace farmfence::sim {

struct TrackEntry {
    std::optional<ports::SensorSample> sample;
    std::optional<ports::SensorError> error;
};

/**
 * @brief Plays back a recorded track into active watches, one entry per call
 *
 * The permission probe is answered from the track: a leading "denied" entry
 * denies, otherwise the first recorded fix grants.
 */
class ReplayLocationSensor : public MockLocationSensor {
public:
    explicit ReplayLocationSensor(std::vector<TrackEntry> track);

    /// Array of fixes {lat, lng, accuracy, heading?, speed?, timestamp} or {error: kind}.
    static std::vector<TrackEntry> parseTrack(const nlohmann::json& json);

    /// @return false once the track is exhausted
    bool replayNext();

    size_t remaining() const { return track_.size() - cursor_; }

private:
    std::vector<TrackEntry> track_;
    size_t cursor_ = 0;
};

} // namespace farmfence::sim
