#pragma once

#include "../ports/IExecutor.hpp"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace geotrack::adapters {

// One worker thread draining a FIFO queue. Tasks still queued at shutdown are run first.
class ThreadExecutor : public ports::IExecutor {
public:
    explicit ThreadExecutor(std::string name);
    ~ThreadExecutor() override;

    ThreadExecutor(const ThreadExecutor&) = delete;
    ThreadExecutor& operator=(const ThreadExecutor&) = delete;

    void post(std::function<void()> task) override;

    void shutdown();
    std::size_t pending() const;

private:
    void run();

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> tasks_;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace geotrack::adapters
