#pragma once

#include "../IClock.hpp"
#include <chrono>
#include <mutex>
#include <string>

namespace geotrack::sim {

// Wall-clock time that only moves when told to.
class SimulatedClock : public IClock {
public:
    explicit SimulatedClock(std::chrono::system_clock::time_point startTime = defaultStart());
    ~SimulatedClock() override = default;

    std::chrono::system_clock::time_point now() const override;
    int64_t epochMillis() const override;
    std::string iso8601() const override;

    void advance(std::chrono::milliseconds duration);
    void setCurrentTime(std::chrono::system_clock::time_point time);

    // 2024-01-01T00:00:00Z, a Monday.
    static std::chrono::system_clock::time_point defaultStart();

private:
    mutable std::mutex mutex_;
    std::chrono::system_clock::time_point simulatedTime_;
};

} // namespace geotrack::sim
