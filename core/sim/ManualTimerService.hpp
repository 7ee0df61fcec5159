#pragma once

#include "SimulatedClock.hpp"
#include "../ports/ITimerService.hpp"
#include <map>
#include <memory>
#include <optional>
#include <utility>

namespace geotrack::sim {

/**
 * @brief Timer service driven by a SimulatedClock
 *
 * advance() moves the clock forward timer by timer, setting it to each due
 * time before firing, so callbacks observe exact deadlines. Timers due at the
 * same instant fire in scheduling order.
 */
class ManualTimerService : public ports::ITimerService {
public:
    explicit ManualTimerService(std::shared_ptr<SimulatedClock> clock);

    ports::TimerId schedule(std::chrono::milliseconds delay, std::function<void()> callback) override;
    void cancel(ports::TimerId id) override;

    // Returns the number of callbacks fired.
    std::size_t advance(std::chrono::milliseconds duration);
    std::size_t fireDue();

    std::size_t pending() const { return timers_.size(); }
    bool isPending(ports::TimerId id) const;
    std::optional<std::chrono::system_clock::time_point> nextDue() const;

private:
    // Ordered by due time, then by id.
    using Key = std::pair<std::chrono::system_clock::time_point, ports::TimerId>;

    bool fireNext(std::chrono::system_clock::time_point limit);

    std::shared_ptr<SimulatedClock> clock_;
    std::map<Key, std::function<void()>> timers_;
    std::map<ports::TimerId, Key> index_;
    ports::TimerId nextId_ = 1;
};

} // namespace geotrack::sim
