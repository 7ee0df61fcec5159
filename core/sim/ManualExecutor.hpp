#pragma once

#include "../ports/IExecutor.hpp"
#include <deque>
#include <mutex>

namespace geotrack::sim {

// Runs every task on the posting thread before post() returns.
class InlineExecutor : public ports::IExecutor {
public:
    void post(std::function<void()> task) override { task(); }
};

// Queues tasks until the test calls runPending().
class ManualExecutor : public ports::IExecutor {
public:
    void post(std::function<void()> task) override;

    // Runs queued tasks, including ones posted while running; returns how many ran.
    std::size_t runPending();
    std::size_t pending() const;

private:
    mutable std::mutex mutex_;
    std::deque<std::function<void()>> tasks_;
};

} // namespace geotrack::sim
