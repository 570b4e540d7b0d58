#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace netwatch {

// Fixed set of threads draining a task queue.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t size);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Throws std::runtime_error after stop().
    std::future<void> submit(std::function<void()> task);

    // Lets queued tasks finish, then joins the threads.
    void stop();

    std::size_t size() const { return threads_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> threads_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::queue<std::packaged_task<void()>> tasks_;
    bool stopping_ = false;
};

} // namespace netwatch
