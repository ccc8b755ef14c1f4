#include "omr/WorkerPool.hpp"

#include <algorithm>
#include <exception>

#include <spdlog/spdlog.h>

namespace omr {

size_t WorkerPool::defaultThreadCount() {
    return std::max<size_t>(1, std::thread::hardware_concurrency());
}

WorkerPool::WorkerPool(size_t threads) {
    if (threads == 0) threads = defaultThreadCount();
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i)
        workers_.emplace_back(&WorkerPool::workerThread, this);
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    condition_.notify_all();
    for (auto& w : workers_)
        if (w.joinable()) w.join();
}

void WorkerPool::execute(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
}

void WorkerPool::workerThread() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }

        try {
            task();
        } catch (const std::exception& e) {
            spdlog::error("Worker task failed: {}", e.what());
        } catch (...) {
            spdlog::error("Worker task failed with a non-standard exception");
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
        }
        completion_.notify_all();
    }
}

void WorkerPool::waitAll() {
    std::unique_lock<std::mutex> lock(mutex_);
    completion_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
}

size_t WorkerPool::pendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size() + active_;
}

}
