#include "ThreadExecutor.hpp"
#include "../Log.hpp"

namespace geotrack::adapters {

ThreadExecutor::ThreadExecutor(std::string name) : name_(std::move(name)) {
    worker_ = std::thread([this]() { run(); });
}

ThreadExecutor::~ThreadExecutor() {
    shutdown();
}

void ThreadExecutor::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            Log::get("Executor")->warn("{} is shut down, task dropped", name_);
            return;
        }
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

void ThreadExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !worker_.joinable()) return;
        stopping_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

std::size_t ThreadExecutor::pending() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

void ThreadExecutor::run() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            Log::get("Executor")->error("{} task failed: {}", name_, e.what());
        }
    }
}

} // namespace geotrack::adapters
