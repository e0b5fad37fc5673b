#pragma once

#include "../StreamEvent.hpp"
#include "../ports/IEventBus.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace farmfence::domain {

/**
 * @brief Turns the per-fix current zone into enter/exit transitions
 *
 * On a zone change an Exit for the previous zone is published before the
 * Enter for the new one.
 */
class GeofenceMonitor {
public:
    explicit GeofenceMonitor(std::shared_ptr<ports::IEventBus> eventBus);

    void update(const Position& position, const std::optional<Zone>& currentZone);
    void reset();

    std::optional<std::string> currentZoneId() const;
    const std::vector<std::string>& zonesVisited() const { return zonesVisited_; }

private:
    void publish(GeofenceTransition transition, const std::string& zoneId,
                 const std::string& zoneName, const Position& position);

    std::shared_ptr<ports::IEventBus> eventBus_;

    bool inZone_ = false;
    std::string currentZoneId_;
    std::string currentZoneName_;
    std::vector<std::string> zonesVisited_;
};

} // namespace farmfence::domain
