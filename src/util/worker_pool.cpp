#include "worker_pool.hpp"

WorkerPool::WorkerPool(size_t threads, size_t max_queued)
    : max_queued_(max_queued == 0 ? 1 : max_queued) {
    if (threads == 0) threads = 1;
    workers_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    task_ready_.notify_all();
    task_done_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
}

void WorkerPool::submit(std::function<void()> task) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        task_done_.wait(lock, [this] { return stopping_ || tasks_.size() < max_queued_; });
        if (stopping_) return;
        tasks_.push(std::move(task));
    }
    task_ready_.notify_one();
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    task_done_.wait(lock, [this] { return tasks_.empty() && active_ == 0; });
}

void WorkerPool::worker_loop() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            task_ready_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (stopping_ && tasks_.empty()) return;
            task = std::move(tasks_.front());
            tasks_.pop();
            ++active_;
        }
        // Space freed in the queue; wake a blocked submit()
        task_done_.notify_all();

        task();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
        }
        task_done_.notify_all();
    }
}
