#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace geotrack::ports {

using TimerId = std::uint64_t;
constexpr TimerId kInvalidTimer = 0;

class ITimerService {
public:
    virtual ~ITimerService() = default;

    virtual TimerId schedule(std::chrono::milliseconds delay, std::function<void()> callback) = 0;

    // Idempotent; never waits for a callback that is already running.
    virtual void cancel(TimerId id) = 0;
};

} // namespace geotrack::ports
