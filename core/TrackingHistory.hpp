#pragma once

#include "Types.hpp"
#include <cstddef>
#include <deque>
#include <vector>

namespace farmfence {

/**
 * @brief Bounded FIFO of recent track points for path rendering
 *
 * Points are kept in arrival order. Once the capacity is reached each push
 * evicts the oldest point. No distance filtering happens here.
 */
class TrackingHistory {
public:
    static constexpr size_t DEFAULT_CAPACITY = 50;

    explicit TrackingHistory(size_t capacity = DEFAULT_CAPACITY);

    void push(const TrackingPoint& point);
    void clear() { points_.clear(); }

    size_t size() const { return points_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return points_.empty(); }

    /// Oldest first.
    std::vector<TrackingPoint> points() const;

    /// Total length of the retained path in meters.
    double pathLengthMeters() const;

private:
    size_t capacity_;
    std::deque<TrackingPoint> points_;
};

} // namespace farmfence
