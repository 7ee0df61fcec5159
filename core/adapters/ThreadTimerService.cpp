#include "ThreadTimerService.hpp"
#include "../Log.hpp"

namespace geotrack::adapters {

ThreadTimerService::ThreadTimerService() {
    worker_ = std::thread([this]() { run(); });
}

ThreadTimerService::~ThreadTimerService() {
    shutdown();
}

ports::TimerId ThreadTimerService::schedule(std::chrono::milliseconds delay, std::function<void()> callback) {
    ports::TimerId id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return ports::kInvalidTimer;
        id = nextId_++;
        timers_[id] = Timer{std::chrono::steady_clock::now() + delay, std::move(callback)};
    }
    cv_.notify_one();
    return id;
}

void ThreadTimerService::cancel(ports::TimerId id) {
    if (id == ports::kInvalidTimer) return;
    std::lock_guard<std::mutex> lock(mutex_);
    timers_.erase(id);
}

void ThreadTimerService::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        timers_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

std::size_t ThreadTimerService::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timers_.size();
}

void ThreadTimerService::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopping_) {
        if (timers_.empty()) {
            cv_.wait(lock);
            continue;
        }

        auto next = timers_.begin();
        for (auto it = timers_.begin(); it != timers_.end(); ++it) {
            if (it->second.due < next->second.due) next = it;
        }

        auto due = next->second.due;
        if (due > std::chrono::steady_clock::now()) {
            cv_.wait_until(lock, due);
            continue;
        }

        auto callback = std::move(next->second.callback);
        timers_.erase(next);

        lock.unlock();
        try {
            callback();
        } catch (const std::exception& e) {
            Log::get("Timer")->error("callback failed: {}", e.what());
        }
        lock.lock();
    }
}

} // namespace geotrack::adapters
