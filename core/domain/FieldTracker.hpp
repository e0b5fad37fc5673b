#pragma once

#include "PositionStream.hpp"
#include "GeofenceMonitor.hpp"
#include "../ProximityIndex.hpp"
#include "../ports/IFieldDataSource.hpp"
#include "../ports/ILocationSensor.hpp"
#include "../ports/IEventBus.hpp"
#include "../IClock.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace farmfence::domain {

struct EngineConfig {
    StreamConfig stream;
    double proximityRadiusMeters = ProximityIndex::DEFAULT_RADIUS_METERS;

    std::string zonesFile;   ///< JSON snapshot of zones (CLI only)
    std::string treesFile;   ///< JSON snapshot of trees (CLI only)
    std::string trackFile;   ///< Recorded fixes to replay (CLI only)
};

/**
 * @brief Consumer-facing engine tying the position stream to zones and trees
 *
 * Every accepted fix is resolved against the current data snapshot inside the
 * sensor callback: the proximity result at the configured radius is cached,
 * geofence transitions are published and the proximity handler is invoked.
 * getProximity() recomputes on demand from the latest fix and snapshot.
 */
class FieldTracker {
public:
    using ProximityHandler = std::function<void(const Position&, const ProximityResult&)>;

    FieldTracker(std::shared_ptr<ports::ILocationSensor> sensor,
                 std::shared_ptr<ports::IFieldDataSource> dataSource,
                 std::shared_ptr<ports::IEventBus> eventBus,
                 std::shared_ptr<IClock> clock,
                 EngineConfig config = {});
    ~FieldTracker();

    /**
     * @brief Begin tracking
     * @throws TrackingError when permission is denied or geolocation is unsupported
     */
    void start();
    void stop();
    bool isRunning() const { return stream_->isTracking(); }

    void setProximityHandler(ProximityHandler handler);

    ProximityResult getProximity() const;
    ProximityResult getProximity(double radiusMeters) const;

    /// Result computed for the most recent fix at the configured radius.
    ProximityResult latestProximity() const;

    std::optional<Zone> currentZone() const;
    TrackingSession session() const;

    PositionStream& stream() { return *stream_; }
    const PositionStream& stream() const { return *stream_; }
    const EngineConfig& config() const { return config_; }

private:
    void onPosition(const Position& position);

    std::shared_ptr<ports::IFieldDataSource> dataSource_;
    std::shared_ptr<ports::IEventBus> eventBus_;
    std::unique_ptr<PositionStream> stream_;

    EngineConfig config_;

    mutable std::mutex mutex_;
    GeofenceMonitor geofenceMonitor_;
    ProximityResult latest_;
    ProximityHandler proximityHandler_;
};

} // namespace farmfence::domain
