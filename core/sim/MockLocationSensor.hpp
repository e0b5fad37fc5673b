#pragma once

#include "../ports/ILocationSensor.hpp"
#include <deque>
#include <map>
#include <optional>
#include <vector>

namespace farmfence::sim {

/**
 * @brief Scriptable in-memory location sensor
 *
 * Samples and errors are pushed by the test and delivered synchronously to
 * every active watch. One-shot requests answer from a queue of readings,
 * falling back to the configured default.
 */
class MockLocationSensor : public ports::ILocationSensor {
public:
    MockLocationSensor();
    ~MockLocationSensor() override = default;

    // ILocationSensor interface
    bool isSupported() const override { return supported_; }
    std::optional<PermissionState> queryPermission() override { return queryablePermission_; }
    ports::SensorReading getCurrentPosition(const ports::SensorOptions& options) override;
    WatchId watchPosition(const ports::SensorOptions& options,
                          SampleHandler onSample,
                          ErrorHandler onError) override;
    void clearWatch(WatchId id) override;

    // Mock-specific methods for testing
    void setSupported(bool supported) { supported_ = supported; }
    void setQueryablePermission(std::optional<PermissionState> state) { queryablePermission_ = state; }

    void setDefaultReading(const ports::SensorReading& reading) { defaultReading_ = reading; }
    void grantPermission();
    void denyPermission();
    void queueReading(const ports::SensorReading& reading) { readings_.push_back(reading); }

    void emitSample(const ports::SensorSample& sample);
    void emitError(ports::SensorErrorCode code, const std::string& message = "");

    size_t activeWatchCount() const { return watches_.size(); }
    size_t probeCount() const { return probeOptions_.size(); }
    const std::vector<ports::SensorOptions>& probeOptions() const { return probeOptions_; }
    const std::optional<ports::SensorOptions>& lastWatchOptions() const { return lastWatchOptions_; }

    static ports::SensorSample makeSample(double lat, double lon, double accuracy = 5.0,
                                          uint64_t timestampMs = 0);

private:
    struct Watch {
        SampleHandler onSample;
        ErrorHandler onError;
    };

    bool supported_ = true;
    std::optional<PermissionState> queryablePermission_;
    ports::SensorReading defaultReading_;
    std::deque<ports::SensorReading> readings_;

    std::map<WatchId, Watch> watches_;
    WatchId nextWatchId_ = 1;

    std::vector<ports::SensorOptions> probeOptions_;
    std::optional<ports::SensorOptions> lastWatchOptions_;
};

} // namespace farmfence::sim
