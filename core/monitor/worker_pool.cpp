#include "monitor/worker_pool.h"

#include <stdexcept>

namespace netwatch {

WorkerPool::WorkerPool(std::size_t size) {
    if (size == 0) {
        size = 1;
    }
    threads_.reserve(size);
    for (std::size_t i = 0; i < size; ++i) {
        threads_.emplace_back(&WorkerPool::worker_loop, this);
    }
}

WorkerPool::~WorkerPool() {
    stop();
}

std::future<void> WorkerPool::submit(std::function<void()> task) {
    std::packaged_task<void()> packaged(std::move(task));
    auto future = packaged.get_future();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            throw std::runtime_error("worker pool is stopped");
        }
        tasks_.push(std::move(packaged));
    }
    queue_cv_.notify_one();
    return future;
}

void WorkerPool::stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    queue_cv_.notify_all();

    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void WorkerPool::worker_loop() {
    while (true) {
        std::packaged_task<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }
        // Exceptions land in the task's future
        task();
    }
}

} // namespace netwatch
