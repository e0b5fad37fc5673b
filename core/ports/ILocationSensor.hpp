#pragma once

#include "../Types.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace farmfence::ports {

struct SensorOptions {
    bool enableHighAccuracy = true;
    uint32_t timeoutMs = 10000;
    uint32_t maxAgeMs = 5000;
};

/// Raw fix as delivered by the platform, before any filtering.
struct SensorSample {
    double latitude = 0.0;
    double longitude = 0.0;
    double accuracyMeters = 0.0;
    std::optional<double> headingDegrees;
    std::optional<double> speedMps;
    uint64_t timestampMs = 0;
};

/// Numeric values follow the W3C geolocation error codes.
enum class SensorErrorCode {
    PermissionDenied = 1,
    PositionUnavailable = 2,
    Timeout = 3
};

struct SensorError {
    SensorErrorCode code = SensorErrorCode::PositionUnavailable;
    std::string message;
};

struct SensorReading {
    std::optional<SensorSample> sample;
    SensorError error;

    bool ok() const { return sample.has_value(); }
};

/**
 * @brief Platform location provider
 *
 * Watch callbacks may arrive on any thread but are delivered one at a time
 * and in order. After clearWatch returns no further callback for that watch
 * may start.
 */
class ILocationSensor {
public:
    virtual ~ILocationSensor() = default;

    using WatchId = int;
    using SampleHandler = std::function<void(const SensorSample&)>;
    using ErrorHandler = std::function<void(const SensorError&)>;

    virtual bool isSupported() const = 0;

    /// Permission as reported without prompting; nullopt when the platform cannot tell.
    virtual std::optional<PermissionState> queryPermission() = 0;

    /// One-shot fix; blocks until a fix, an error or the options' timeout.
    virtual SensorReading getCurrentPosition(const SensorOptions& options) = 0;

    virtual WatchId watchPosition(const SensorOptions& options,
                                  SampleHandler onSample,
                                  ErrorHandler onError) = 0;
    virtual void clearWatch(WatchId id) = 0;
};

} // namespace farmfence::ports
