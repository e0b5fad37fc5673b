#include "PositionStream.hpp"
#include "../GeoMath.hpp"
#include <iostream>

namespace farmfence::domain {

PositionStream::PositionStream(std::shared_ptr<ports::ILocationSensor> sensor,
                               std::shared_ptr<ports::IEventBus> eventBus,
                               std::shared_ptr<IClock> clock,
                               StreamConfig config)
    : sensor_(std::move(sensor)), eventBus_(std::move(eventBus)), clock_(std::move(clock)),
      config_(config), history_(config.historyCapacity) {
    if (!sensor_) {
        throw std::invalid_argument("PositionStream: location sensor cannot be null");
    }
    if (!eventBus_) {
        throw std::invalid_argument("PositionStream: event bus cannot be null");
    }
    if (!clock_) {
        throw std::invalid_argument("PositionStream: clock cannot be null");
    }
}

PositionStream::~PositionStream() {
    stopTracking();
}

PermissionState PositionStream::checkPermission() {
    if (!sensor_->isSupported()) {
        std::lock_guard<std::mutex> lock(mutex_);
        updatePermission(PermissionState::Denied);
        return PermissionState::Denied;
    }

    auto reported = sensor_->queryPermission();

    std::lock_guard<std::mutex> lock(mutex_);
    if (reported) {
        updatePermission(*reported);
    }
    return permissionState_;
}

PermissionState PositionStream::requestPermission() {
    if (!sensor_->isSupported()) {
        std::lock_guard<std::mutex> lock(mutex_);
        updatePermission(PermissionState::Denied);
        return PermissionState::Denied;
    }

    ports::SensorOptions probe;
    probe.enableHighAccuracy = false;
    probe.timeoutMs = PERMISSION_PROBE_TIMEOUT_MS;
    probe.maxAgeMs = PERMISSION_PROBE_MAX_AGE_MS;

    auto reading = sensor_->getCurrentPosition(probe);

    PermissionState result = PermissionState::Granted;
    if (!reading.ok()) {
        // Unavailable and timeout say nothing about the user's decision yet
        result = reading.error.code == ports::SensorErrorCode::PermissionDenied
            ? PermissionState::Denied
            : PermissionState::Prompt;
    }

    std::clog << "[PositionStream] Permission probe: " << permissionStateToString(result) << std::endl;

    std::lock_guard<std::mutex> lock(mutex_);
    updatePermission(result);
    return result;
}

void PositionStream::startTracking(TrackingCallbacks callbacks) {
    startTracking(std::move(callbacks), config());
}

void PositionStream::startTracking(TrackingCallbacks callbacks, const StreamConfig& config) {
    if (!sensor_->isSupported()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastError_ = ErrorKind::Unsupported;
            transitionTo(TrackingState::Error);
        }
        throw TrackingError(ErrorKind::Unsupported, "Geolocation is not supported");
    }

    if (getCurrentState() == TrackingState::Active) {
        std::clog << "[PositionStream] Already tracking, stopping previous session" << std::endl;
        stopTracking();
    }

    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (config.historyCapacity != config_.historyCapacity) {
            TrackingHistory resized(config.historyCapacity);
            for (const auto& point : history_.points()) {
                resized.push(point);
            }
            history_ = std::move(resized);
        }
        config_ = config;
        callbacks_ = std::move(callbacks);
        lastError_.reset();
        lastPosition_.reset();
        session_ = TrackingSession{};
        session_.startedAtMs = clock_->epochMillis();
        generation = ++generation_;
        processSignal(StreamSignal::StartRequested);
    }

    PermissionState permission = requestPermission();

    if (permission == PermissionState::Denied) {
        TrackingCallbacks failed;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lastError_ = ErrorKind::PermissionDenied;
            processSignal(StreamSignal::PermissionDenied);
            eventBus_->publish(TrackingErrorEvent{ErrorKind::PermissionDenied, "Location permission denied"});
            failed = std::move(callbacks_);
            callbacks_ = {};
        }
        if (failed.onPermissionDenied) failed.onPermissionDenied();
        throw TrackingError(ErrorKind::PermissionDenied, "Location permission denied");
    }

    ports::SensorOptions options = config.sensorOptions();
    std::clog << "[PositionStream] Starting watch (highAccuracy=" << (options.enableHighAccuracy ? "true" : "false")
              << ", timeout=" << options.timeoutMs << "ms, maxAge=" << options.maxAgeMs << "ms)" << std::endl;

    auto watchId = sensor_->watchPosition(
        options,
        [this, generation](const ports::SensorSample& sample) { handleSample(sample, generation); },
        [this, generation](const ports::SensorError& error) { handleError(error, generation); });

    std::function<void()> onGranted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        watchId_ = watchId;
        session_.active = true;
        processSignal(StreamSignal::PermissionGranted);
        onGranted = callbacks_.onPermissionGranted;
    }

    if (onGranted) onGranted();
}

void PositionStream::stopTracking() {
    std::optional<ports::ILocationSensor::WatchId> watchId;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (currentState_ == TrackingState::Idle && !watchId_) {
            return;
        }
        watchId = watchId_;
        watchId_.reset();
        ++generation_;
    }

    if (watchId) {
        sensor_->clearWatch(*watchId);
        std::clog << "[PositionStream] Tracking stopped" << std::endl;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_ = {};
    lastPosition_.reset();
    if (session_.active) {
        session_.active = false;
        session_.endedAtMs = clock_->epochMillis();
    }
    processSignal(StreamSignal::StopRequested);
}

Position PositionStream::getCurrentPosition() {
    if (!sensor_->isSupported()) {
        throw TrackingError(ErrorKind::Unsupported, "Geolocation is not supported");
    }

    auto reading = sensor_->getCurrentPosition(config().sensorOptions());
    if (!reading.ok()) {
        throw TrackingError(classifyError(reading.error.code), reading.error.message);
    }
    return toPosition(*reading.sample);
}

void PositionStream::handleSample(const ports::SensorSample& sample, uint64_t generation) {
    Position position = toPosition(sample);
    std::function<void(const Position&)> onSuccess;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) return;
        if (currentState_ != TrackingState::Active && currentState_ != TrackingState::Requesting) return;

        if (position.latitude < -90.0 || position.latitude > 90.0 ||
            position.longitude < -180.0 || position.longitude > 180.0 ||
            position.accuracyMeters < 0.0) {
            std::cerr << "[PositionStream] Discarding malformed fix ("
                      << position.latitude << ", " << position.longitude << ")" << std::endl;
            return;
        }

        if (config_.maxAccuracyMeters && position.accuracyMeters > *config_.maxAccuracyMeters) {
            return;
        }

        double moved = 0.0;
        if (lastPosition_) {
            moved = GeoMath::distanceMeters(lastPosition_->point(), position.point());
            if (config_.distanceFilterMeters && moved < *config_.distanceFilterMeters) {
                return;
            }
        }

        session_.totalDistanceMeters += moved;
        session_.sampleCount += 1;
        session_.averageAccuracyMeters +=
            (position.accuracyMeters - session_.averageAccuracyMeters) / static_cast<double>(session_.sampleCount);

        lastPosition_ = position;
        history_.push({position.latitude, position.longitude, position.timestampMs});
        eventBus_->publish(PositionEvent{position});
        onSuccess = callbacks_.onSuccess;
    }

    if (onSuccess) onSuccess(position);
}

void PositionStream::handleError(const ports::SensorError& error, uint64_t generation) {
    ErrorKind kind = classifyError(error.code);
    std::string message = error.message.empty() ? errorKindToString(kind) : error.message;
    TrackingCallbacks callbacks;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (generation != generation_) return;

        std::cerr << "[PositionStream] Sensor error: " << errorKindToString(kind)
                  << " (" << message << ")" << std::endl;

        lastError_ = kind;
        eventBus_->publish(TrackingErrorEvent{kind, message});
        callbacks = callbacks_;

        if (kind == ErrorKind::PermissionDenied) {
            updatePermission(PermissionState::Denied);
            processSignal(StreamSignal::FatalError);
            lastPosition_.reset();
            if (session_.active) {
                session_.active = false;
                session_.endedAtMs = clock_->epochMillis();
            }
        }
    }

    if (kind == ErrorKind::PermissionDenied) {
        // Fatal: release the platform watch; a new startTracking() is required
        std::optional<ports::ILocationSensor::WatchId> watchId;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            watchId = watchId_;
            watchId_.reset();
            ++generation_;
        }
        if (watchId) sensor_->clearWatch(*watchId);
        if (callbacks.onPermissionDenied) callbacks.onPermissionDenied();
    }

    if (callbacks.onError) callbacks.onError(kind, message);
}

void PositionStream::processSignal(StreamSignal signal) {
    TrackingState newState = currentState_;
    
    switch (currentState_) {
        case TrackingState::Idle:
            if (signal == StreamSignal::StartRequested) {
                newState = TrackingState::Requesting;
            }
            break;
            
        case TrackingState::Requesting:
            if (signal == StreamSignal::PermissionGranted) {
                newState = TrackingState::Active;
            } else if (signal == StreamSignal::PermissionDenied || signal == StreamSignal::FatalError) {
                newState = TrackingState::Error;
            } else if (signal == StreamSignal::StopRequested) {
                newState = TrackingState::Idle;
            }
            break;
            
        case TrackingState::Active:
            if (signal == StreamSignal::StopRequested) {
                newState = TrackingState::Idle;
            } else if (signal == StreamSignal::FatalError) {
                newState = TrackingState::Error;
            }
            break;
            
        case TrackingState::Error:
            if (signal == StreamSignal::StartRequested) {
                newState = TrackingState::Requesting;
            } else if (signal == StreamSignal::StopRequested) {
                newState = TrackingState::Idle;
            }
            break;
    }
    
    if (newState != currentState_) {
        transitionTo(newState);
    }
}

void PositionStream::transitionTo(TrackingState newState) {
    TrackingState oldState = currentState_;
    currentState_ = newState;
    
    std::clog << "[PositionStream] State transition: " << trackingStateToString(oldState)
              << " -> " << trackingStateToString(newState) << std::endl;
}

void PositionStream::updatePermission(PermissionState state) {
    if (permissionState_ == state) return;

    permissionState_ = state;
    eventBus_->publish(PermissionChangedEvent{state});
}

TrackingState PositionStream::getCurrentState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentState_;
}

PermissionState PositionStream::permissionState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return permissionState_;
}

std::optional<ErrorKind> PositionStream::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastError_;
}

std::optional<Position> PositionStream::lastPosition() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastPosition_;
}

std::vector<TrackingPoint> PositionStream::history() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.points();
}

TrackingSession PositionStream::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

StreamConfig PositionStream::config() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_;
}

StreamStatus PositionStream::status() const {
    bool supported = sensor_->isSupported();

    std::lock_guard<std::mutex> lock(mutex_);
    StreamStatus status;
    status.trackingState = currentState_;
    status.permissionState = permissionState_;
    status.lastError = lastError_;
    status.lastPosition = lastPosition_;
    status.supported = supported;
    return status;
}

ErrorKind PositionStream::classifyError(ports::SensorErrorCode code) {
    switch (code) {
        case ports::SensorErrorCode::PermissionDenied: return ErrorKind::PermissionDenied;
        case ports::SensorErrorCode::Timeout: return ErrorKind::Timeout;
        case ports::SensorErrorCode::PositionUnavailable:
        default: return ErrorKind::PositionUnavailable;
    }
}

Position PositionStream::toPosition(const ports::SensorSample& sample) {
    Position position;
    position.latitude = sample.latitude;
    position.longitude = sample.longitude;
    position.accuracyMeters = sample.accuracyMeters;
    position.headingDegrees = sample.headingDegrees;
    position.speedMps = sample.speedMps;
    position.timestampMs = sample.timestampMs;
    return position;
}

} // namespace farmfence::domain
