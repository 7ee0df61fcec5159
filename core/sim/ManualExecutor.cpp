#include "ManualExecutor.hpp"

namespace geotrack::sim {

void ManualExecutor::post(std::function<void()> task) {
    std::lock_guard<std::mutex> lock(mutex_);
    tasks_.push_back(std::move(task));
}

std::size_t ManualExecutor::runPending() {
    std::size_t ran = 0;
    while (true) {
        std::function<void()> task;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (tasks_.empty()) break;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task();
        ++ran;
    }
    return ran;
}

std::size_t ManualExecutor::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

} // namespace geotrack::sim
