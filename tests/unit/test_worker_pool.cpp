#include "monitor/worker_pool.h"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

using namespace netwatch;

TEST(WorkerPool, RunsSubmittedTasks) {
    WorkerPool pool(3);
    std::atomic<int> done{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool.submit([&done] { ++done; }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(done.load(), 20);
}

TEST(WorkerPool, ConcurrencyIsBoundedByPoolSize) {
    WorkerPool pool(2);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(pool.submit([&] {
            int now = ++active;
            int seen = peak.load();
            while (now > seen && !peak.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
            --active;
        }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_LE(peak.load(), 2);
    EXPECT_GE(peak.load(), 1);
}

TEST(WorkerPool, TaskExceptionReachesFuture) {
    WorkerPool pool(1);
    auto f = pool.submit([] { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);

    // The worker survives the exception
    auto g = pool.submit([] {});
    EXPECT_NO_THROW(g.get());
}

TEST(WorkerPool, SubmitAfterStopThrows) {
    WorkerPool pool(1);
    pool.stop();
    EXPECT_THROW(pool.submit([] {}), std::runtime_error);
}

TEST(WorkerPool, StopDrainsQueuedTasks) {
    std::atomic<int> done{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 5; ++i) {
            pool.submit([&done] {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
                ++done;
            });
        }
        pool.stop();
    }
    EXPECT_EQ(done.load(), 5);
}
