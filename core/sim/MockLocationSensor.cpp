#include "MockLocationSensor.hpp"

namespace farmfence::sim {

MockLocationSensor::MockLocationSensor() {
    grantPermission();
}

void MockLocationSensor::grantPermission() {
    defaultReading_ = ports::SensorReading{};
    defaultReading_.sample = makeSample(10.7620, 106.6600, 25.0);
}

void MockLocationSensor::denyPermission() {
    defaultReading_ = ports::SensorReading{};
    defaultReading_.error = {ports::SensorErrorCode::PermissionDenied, "User denied Geolocation"};
}

ports::SensorReading MockLocationSensor::getCurrentPosition(const ports::SensorOptions& options) {
    probeOptions_.push_back(options);

    if (!readings_.empty()) {
        auto reading = readings_.front();
        readings_.pop_front();
        return reading;
    }
    return defaultReading_;
}

ports::ILocationSensor::WatchId MockLocationSensor::watchPosition(const ports::SensorOptions& options,
                                                                  SampleHandler onSample,
                                                                  ErrorHandler onError) {
    WatchId id = nextWatchId_++;
    watches_[id] = Watch{std::move(onSample), std::move(onError)};
    lastWatchOptions_ = options;
    return id;
}

void MockLocationSensor::clearWatch(WatchId id) {
    watches_.erase(id);
}

void MockLocationSensor::emitSample(const ports::SensorSample& sample) {
    // Handlers may clear their own watch
    auto watches = watches_;
    for (const auto& [id, watch] : watches) {
        if (watches_.count(id) && watch.onSample) {
            watch.onSample(sample);
        }
    }
}

void MockLocationSensor::emitError(ports::SensorErrorCode code, const std::string& message) {
    auto watches = watches_;
    for (const auto& [id, watch] : watches) {
        if (watches_.count(id) && watch.onError) {
            watch.onError(ports::SensorError{code, message});
        }
    }
}

ports::SensorSample MockLocationSensor::makeSample(double lat, double lon, double accuracy,
                                                   uint64_t timestampMs) {
    ports::SensorSample sample;
    sample.latitude = lat;
    sample.longitude = lon;
    sample.accuracyMeters = accuracy;
    sample.timestampMs = timestampMs;
    return sample;
}

} // namespace farmfence::sim
