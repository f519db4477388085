#include <gtest/gtest.h>
#include "concurrency/SharedInit.hpp"
#include "concurrency/ThreadPool.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace pt::concurrency;
using namespace std::chrono;

TEST(SharedInitTest, FactoryRunsOnceForConcurrentCallers) {
    std::atomic<int> runs{0};
    SharedInit<int> init([&] {
        ++runs;
        std::this_thread::sleep_for(milliseconds(50));
        return std::make_shared<int>(7);
    });

    std::vector<std::thread> threads;
    std::atomic<int> sum{0};
    for (int i = 0; i < 8; ++i) threads.emplace_back([&] { sum += *init.get(); });
    for (auto& t : threads) t.join();

    EXPECT_EQ(runs.load(), 1);
    EXPECT_EQ(sum.load(), 56);
    EXPECT_TRUE(init.ready());
}

TEST(SharedInitTest, FailureReachesEveryWaiterAndIsNotCached) {
    std::atomic<int> runs{0};
    SharedInit<int> init([&]() -> std::shared_ptr<int> {
        const int n = ++runs;
        std::this_thread::sleep_for(milliseconds(50));
        if (n == 1) throw std::runtime_error("credentials unavailable");
        return std::make_shared<int>(n);
    });

    std::atomic<int> failures{0}, successes{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i)
        threads.emplace_back([&] {
            try {
                if (init.get()) ++successes;
            } catch (const std::runtime_error&) {
                ++failures;
            }
        });
    for (auto& t : threads) t.join();

    // callers of the failed attempt see its error, later callers retry
    EXPECT_GE(failures.load(), 1);
    EXPECT_EQ(failures.load() + successes.load(), 4);

    const auto value = init.get();
    ASSERT_NE(value, nullptr);
    EXPECT_GE(*value, 2);
}

TEST(SharedInitTest, NotReadyBeforeFirstUse) {
    SharedInit<int> init([] { return std::make_shared<int>(1); });
    EXPECT_FALSE(init.ready());
}

namespace {

struct CountingTask final : Task {
    std::atomic<int>& counter;
    explicit CountingTask(std::atomic<int>& c) : counter(c) {}
    void operator()() override { ++counter; }
};

struct ThrowingTask final : Task {
    void operator()() override { throw std::runtime_error("task failed"); }
};

}

TEST(ThreadPoolTest, StopDrainsQueuedTasks) {
    std::atomic<int> counter{0};
    {
        ThreadPool pool(2);
        EXPECT_EQ(pool.workerCount(), 2u);
        for (int i = 0; i < 20; ++i) pool.submit(std::make_shared<CountingTask>(counter));
        pool.stop();
    }
    EXPECT_EQ(counter.load(), 20);
}

TEST(ThreadPoolTest, WorkerSurvivesThrowingTask) {
    std::atomic<int> counter{0};
    ThreadPool pool(1);
    pool.submit(std::make_shared<ThrowingTask>());
    pool.submit(std::make_shared<CountingTask>(counter));
    pool.stop();
    EXPECT_EQ(counter.load(), 1);
}

TEST(ThreadPoolTest, RejectsSubmitAfterStop) {
    std::atomic<int> counter{0};
    ThreadPool pool(1);
    pool.stop();
    EXPECT_THROW(pool.submit(std::make_shared<CountingTask>(counter)), std::runtime_error);
}

TEST(ThreadPoolTest, ZeroThreadsStillRuns) {
    std::atomic<int> counter{0};
    ThreadPool pool(0);
    EXPECT_EQ(pool.workerCount(), 1u);
    pool.submit(std::make_shared<CountingTask>(counter));
    pool.stop();
    EXPECT_EQ(counter.load(), 1);
}
