#pragma once

#include "../ports/ITimerService.hpp"
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <thread>

namespace geotrack::adapters {

/**
 * @brief Timer service backed by one steady-clock worker thread
 *
 * Callbacks run on the worker thread without the service lock held, so a
 * callback may schedule or cancel timers. Callbacks must stay short; the
 * domain only uses them to post work to an executor.
 */
class ThreadTimerService : public ports::ITimerService {
public:
    ThreadTimerService();
    ~ThreadTimerService() override;

    ThreadTimerService(const ThreadTimerService&) = delete;
    ThreadTimerService& operator=(const ThreadTimerService&) = delete;

    ports::TimerId schedule(std::chrono::milliseconds delay, std::function<void()> callback) override;
    void cancel(ports::TimerId id) override;

    void shutdown();
    std::size_t pending() const;

private:
    struct Timer {
        std::chrono::steady_clock::time_point due;
        std::function<void()> callback;
    };

    void run();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::map<ports::TimerId, Timer> timers_;
    ports::TimerId nextId_ = 1;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace geotrack::adapters
