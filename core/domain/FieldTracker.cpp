#include "FieldTracker.hpp"
#include <iostream>
#include <stdexcept>

namespace farmfence::domain {

FieldTracker::FieldTracker(std::shared_ptr<ports::ILocationSensor> sensor,
                           std::shared_ptr<ports::IFieldDataSource> dataSource,
                           std::shared_ptr<ports::IEventBus> eventBus,
                           std::shared_ptr<IClock> clock,
                           EngineConfig config)
    : dataSource_(std::move(dataSource)), eventBus_(eventBus), config_(config),
      geofenceMonitor_(eventBus) {
    if (!dataSource_) {
        throw std::invalid_argument("FieldTracker: data source cannot be null");
    }
    stream_ = std::make_unique<PositionStream>(std::move(sensor), std::move(eventBus),
                                               std::move(clock), config.stream);
}

FieldTracker::~FieldTracker() {
    stream_->stopTracking();
}

void FieldTracker::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        geofenceMonitor_.reset();
        latest_ = ProximityResult{};
    }

    TrackingCallbacks callbacks;
    callbacks.onSuccess = [this](const Position& position) { onPosition(position); };
    callbacks.onError = [](ErrorKind kind, const std::string& message) {
        if (kind != ErrorKind::PermissionDenied) {
            std::cerr << "[FieldTracker] Waiting for fix: " << message << std::endl;
        }
    };
    callbacks.onPermissionDenied = []() {
        std::cerr << "[FieldTracker] Location permission denied" << std::endl;
    };

    stream_->startTracking(std::move(callbacks), config_.stream);
    std::clog << "[FieldTracker] Tracking started, proximity radius "
              << config_.proximityRadiusMeters << "m" << std::endl;
}

void FieldTracker::stop() {
    stream_->stopTracking();

    std::lock_guard<std::mutex> lock(mutex_);
    latest_ = ProximityResult{};
}

void FieldTracker::setProximityHandler(ProximityHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    proximityHandler_ = std::move(handler);
}

ProximityResult FieldTracker::getProximity() const {
    return getProximity(config_.proximityRadiusMeters);
}

ProximityResult FieldTracker::getProximity(double radiusMeters) const {
    return ProximityIndex::compute(stream_->lastPosition(), radiusMeters,
                                   dataSource_->trees(), dataSource_->zones());
}

ProximityResult FieldTracker::latestProximity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
}

std::optional<Zone> FieldTracker::currentZone() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_.currentZone;
}

TrackingSession FieldTracker::session() const {
    TrackingSession session = stream_->session();

    std::lock_guard<std::mutex> lock(mutex_);
    session.zonesVisited = geofenceMonitor_.zonesVisited();
    return session;
}

void FieldTracker::onPosition(const Position& position) {
    auto result = ProximityIndex::compute(position, config_.proximityRadiusMeters,
                                          dataSource_->trees(), dataSource_->zones());

    ProximityHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        geofenceMonitor_.update(position, result.currentZone);
        latest_ = result;
        handler = proximityHandler_;
    }

    if (handler) handler(position, result);
}

} // namespace farmfence::domain
