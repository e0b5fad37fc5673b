#pragma once

#include "../Types.hpp"
#include "../TrackingHistory.hpp"
#include "../IClock.hpp"
#include "../ports/ILocationSensor.hpp"
#include "../ports/IEventBus.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

namespace farmfence::domain {

struct StreamConfig {
    bool enableHighAccuracy = true;
    uint32_t timeoutMs = 10000;
    uint32_t maxAgeMs = 5000;
    std::optional<double> distanceFilterMeters;   ///< Suppress fixes closer than this to the last emitted one
    std::optional<double> maxAccuracyMeters;      ///< Drop fixes reporting a worse accuracy
    size_t historyCapacity = TrackingHistory::DEFAULT_CAPACITY;

    ports::SensorOptions sensorOptions() const {
        return {enableHighAccuracy, timeoutMs, maxAgeMs};
    }
};

/// Optional direct callbacks, invoked synchronously in addition to bus events.
struct TrackingCallbacks {
    std::function<void(const Position&)> onSuccess;
    std::function<void(ErrorKind, const std::string&)> onError;
    std::function<void()> onPermissionGranted;
    std::function<void()> onPermissionDenied;
};

class TrackingError : public std::runtime_error {
public:
    TrackingError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

struct StreamStatus {
    TrackingState trackingState = TrackingState::Idle;
    PermissionState permissionState = PermissionState::Unknown;
    std::optional<ErrorKind> lastError;
    std::optional<Position> lastPosition;
    bool supported = false;
};

enum class StreamSignal {
    StartRequested,
    PermissionGranted,
    PermissionDenied,
    FatalError,
    StopRequested
};

/**
 * @brief Permission and tracking state machine over a platform location sensor
 *
 * Idle -> Requesting -> Active -> Idle, with Requesting/Active -> Error on
 * permission denial and Error -> Requesting on a new startTracking().
 *
 * Accepted fixes are published as PositionEvent on the event bus, appended to
 * the tracking history and passed to TrackingCallbacks::onSuccess. The last
 * position, history and session are guarded by a mutex so they can be read
 * from another thread than the sensor callback.
 */
class PositionStream {
public:
    PositionStream(std::shared_ptr<ports::ILocationSensor> sensor,
                   std::shared_ptr<ports::IEventBus> eventBus,
                   std::shared_ptr<IClock> clock,
                   StreamConfig config = {});
    ~PositionStream();

    PositionStream(const PositionStream&) = delete;
    PositionStream& operator=(const PositionStream&) = delete;

    /// Best-effort, non-prompting query; falls back to the last observed state.
    PermissionState checkPermission();

    /// Low-accuracy one-shot fix used only to surface the OS permission prompt.
    PermissionState requestPermission();

    /**
     * @brief Start continuous tracking, restarting an active session
     * @throws TrackingError with PermissionDenied or Unsupported
     */
    void startTracking(TrackingCallbacks callbacks = {});
    void startTracking(TrackingCallbacks callbacks, const StreamConfig& config);

    /// Synchronously unsubscribes; no-op when idle.
    void stopTracking();

    /**
     * @brief One-shot fix with the stream's sensor options
     * @throws TrackingError classified from the sensor error
     */
    Position getCurrentPosition();

    TrackingState getCurrentState() const;
    PermissionState permissionState() const;
    bool isTracking() const { return getCurrentState() == TrackingState::Active; }
    std::optional<ErrorKind> lastError() const;
    std::optional<Position> lastPosition() const;
    std::vector<TrackingPoint> history() const;
    TrackingSession session() const;
    StreamStatus status() const;
    StreamConfig config() const;

    static ErrorKind classifyError(ports::SensorErrorCode code);
    static Position toPosition(const ports::SensorSample& sample);

private:
    void processSignal(StreamSignal signal);
    void transitionTo(TrackingState newState);
    void updatePermission(PermissionState state);
    void handleSample(const ports::SensorSample& sample, uint64_t generation);
    void handleError(const ports::SensorError& error, uint64_t generation);

    static constexpr uint32_t PERMISSION_PROBE_TIMEOUT_MS = 10000;
    static constexpr uint32_t PERMISSION_PROBE_MAX_AGE_MS = 60000;

    std::shared_ptr<ports::ILocationSensor> sensor_;
    std::shared_ptr<ports::IEventBus> eventBus_;
    std::shared_ptr<IClock> clock_;

    mutable std::mutex mutex_;
    StreamConfig config_;
    TrackingCallbacks callbacks_;
    TrackingState currentState_ = TrackingState::Idle;
    PermissionState permissionState_ = PermissionState::Unknown;
    std::optional<ErrorKind> lastError_;
    std::optional<ports::ILocationSensor::WatchId> watchId_;
    uint64_t generation_ = 0;

    std::optional<Position> lastPosition_;
    TrackingHistory history_;
    TrackingSession session_;
};

} // namespace farmfence::domain
