#include "GeofenceMonitor.hpp"
#include <algorithm>
#include <stdexcept>

namespace farmfence::domain {

GeofenceMonitor::GeofenceMonitor(std::shared_ptr<ports::IEventBus> eventBus)
    : eventBus_(std::move(eventBus)) {
    if (!eventBus_) {
        throw std::invalid_argument("GeofenceMonitor: event bus cannot be null");
    }
}

void GeofenceMonitor::update(const Position& position, const std::optional<Zone>& currentZone) {
    if (inZone_ && currentZone && currentZone->id == currentZoneId_) {
        return;
    }
    if (!inZone_ && !currentZone) {
        return;
    }

    if (inZone_) {
        publish(GeofenceTransition::Exit, currentZoneId_, currentZoneName_, position);
        inZone_ = false;
        currentZoneId_.clear();
        currentZoneName_.clear();
    }

    if (currentZone) {
        inZone_ = true;
        currentZoneId_ = currentZone->id;
        currentZoneName_ = currentZone->name;
        publish(GeofenceTransition::Enter, currentZoneId_, currentZoneName_, position);

        if (std::find(zonesVisited_.begin(), zonesVisited_.end(), currentZoneId_) == zonesVisited_.end()) {
            zonesVisited_.push_back(currentZoneId_);
        }
    }
}

void GeofenceMonitor::reset() {
    inZone_ = false;
    currentZoneId_.clear();
    currentZoneName_.clear();
    zonesVisited_.clear();
}

std::optional<std::string> GeofenceMonitor::currentZoneId() const {
    if (!inZone_) return std::nullopt;
    return currentZoneId_;
}

void GeofenceMonitor::publish(GeofenceTransition transition, const std::string& zoneId,
                              const std::string& zoneName, const Position& position) {
    GeofenceEvent event;
    event.transition = transition;
    event.zoneId = zoneId;
    event.zoneName = zoneName;
    event.position = position;
    eventBus_->publish(event);
}

} // namespace farmfence::domain
