#include "TrackingHistory.hpp"
#include "GeoMath.hpp"

namespace farmfence {

TrackingHistory::TrackingHistory(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

void TrackingHistory::push(const TrackingPoint& point) {
    points_.push_back(point);
    while (points_.size() > capacity_) {
        points_.pop_front();
    }
}

std::vector<TrackingPoint> TrackingHistory::points() const {
    return std::vector<TrackingPoint>(points_.begin(), points_.end());
}

double TrackingHistory::pathLengthMeters() const {
    double total = 0.0;
    for (size_t i = 1; i < points_.size(); ++i) {
        total += GeoMath::distanceMeters(points_[i - 1].latitude, points_[i - 1].longitude,
                                         points_[i].latitude, points_[i].longitude);
    }
    return total;
}

} // namespace farmfence
