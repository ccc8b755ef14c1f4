#pragma once
#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace omr {

// Fixed set of std::threads draining a FIFO queue.
class WorkerPool {
public:
    // 0 = one thread per hardware core.
    explicit WorkerPool(size_t threads = 0);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    size_t size() const { return workers_.size(); }

    // Tasks must not throw; anything that escapes is logged and dropped.
    void execute(std::function<void()> task);

    void waitAll();

    size_t pendingTasks() const;

    static size_t defaultThreadCount();

private:
    void workerThread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;

    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::condition_variable completion_;
    bool stop_ = false;
    size_t active_ = 0;
};

}
