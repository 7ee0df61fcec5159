#include "SimulatedClock.hpp"
#include "../Model.hpp"

namespace geotrack::sim {

SimulatedClock::SimulatedClock(std::chrono::system_clock::time_point startTime)
    : simulatedTime_(startTime) {
}

std::chrono::system_clock::time_point SimulatedClock::defaultStart() {
    return std::chrono::system_clock::time_point(std::chrono::seconds(1704067200));
}

std::chrono::system_clock::time_point SimulatedClock::now() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return simulatedTime_;
}

int64_t SimulatedClock::epochMillis() const {
    return toEpochMillis(now());
}

std::string SimulatedClock::iso8601() const {
    return formatIso8601(now());
}

void SimulatedClock::advance(std::chrono::milliseconds duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ += duration;
}

void SimulatedClock::setCurrentTime(std::chrono::system_clock::time_point time) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulatedTime_ = time;
}

} // namespace geotrack::sim
