#include "SimulatedClock.hpp"

namespace farmfence::sim {

SimulatedClock::SimulatedClock(std::chrono::system_clock::time_point startTime)
    : currentTime_(startTime) {
}

uint64_t SimulatedClock::epochMillis() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        currentTime_.time_since_epoch()).count();
}

std::string SimulatedClock::iso8601() const {
    return formatIso8601(currentTime_);
}

} // namespace farmfence::sim
