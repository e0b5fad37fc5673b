#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <string>

namespace farmfence::sim {

/// Manually driven clock; time only moves through advance() or setCurrentTime().
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(std::chrono::system_clock::time_point startTime = std::chrono::system_clock::time_point{});
    ~SimulatedClock() override = default;

    // IClock interface
    std::chrono::system_clock::time_point now() const override { return currentTime_; }
    uint64_t epochMillis() const override;
    std::string iso8601() const override;

    // Simulation controls
    void advance(std::chrono::milliseconds duration) { currentTime_ += duration; }
    void setCurrentTime(std::chrono::system_clock::time_point time) { currentTime_ = time; }

private:
    std::chrono::system_clock::time_point currentTime_;
};

} // namespace farmfence::sim
