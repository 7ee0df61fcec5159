#include "ManualTimerService.hpp"

namespace geotrack::sim {

ManualTimerService::ManualTimerService(std::shared_ptr<SimulatedClock> clock) : clock_(clock) {
}

ports::TimerId ManualTimerService::schedule(std::chrono::milliseconds delay, std::function<void()> callback) {
    auto id = nextId_++;
    Key key{clock_->now() + delay, id};
    timers_[key] = std::move(callback);
    index_[id] = key;
    return id;
}

void ManualTimerService::cancel(ports::TimerId id) {
    auto it = index_.find(id);
    if (it == index_.end()) return;
    timers_.erase(it->second);
    index_.erase(it);
}

bool ManualTimerService::isPending(ports::TimerId id) const {
    return index_.count(id) > 0;
}

std::optional<std::chrono::system_clock::time_point> ManualTimerService::nextDue() const {
    if (timers_.empty()) return std::nullopt;
    return timers_.begin()->first.first;
}

bool ManualTimerService::fireNext(std::chrono::system_clock::time_point limit) {
    if (timers_.empty()) return false;

    auto it = timers_.begin();
    if (it->first.first > limit) return false;

    auto due = it->first.first;
    auto callback = std::move(it->second);
    index_.erase(it->first.second);
    timers_.erase(it);

    if (due > clock_->now()) {
        clock_->setCurrentTime(due);
    }
    callback();
    return true;
}

std::size_t ManualTimerService::advance(std::chrono::milliseconds duration) {
    auto target = clock_->now() + duration;
    std::size_t fired = 0;
    while (fireNext(target)) {
        ++fired;
    }
    clock_->setCurrentTime(target);
    return fired;
}

std::size_t ManualTimerService::fireDue() {
    return advance(std::chrono::milliseconds(0));
}

} // namespace geotrack::sim
