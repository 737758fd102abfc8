#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

// Fixed-size pool of worker threads draining a FIFO task queue.
// submit() blocks while `max_queued` tasks are already waiting, so a fast
// producer (the tree walker) cannot run arbitrarily far ahead of the workers.
class WorkerPool {
public:
    explicit WorkerPool(size_t threads, size_t max_queued = 1024);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void submit(std::function<void()> task);

    // Block until the queue is empty and no task is running.
    void wait_idle();

    size_t size() const { return workers_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable task_ready_;
    std::condition_variable task_done_;
    size_t max_queued_;
    size_t active_ = 0;
    bool stopping_ = false;
};
