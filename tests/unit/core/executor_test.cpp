#include <gtest/gtest.h>

#include <omc/core/executor.h>

#include <atomic>
#include <future>
#include <stdexcept>
#include <vector>

using omc::core::WorkerPool;

TEST(WorkerPoolTest, SubmitReturnsResults) {
    WorkerPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 32; ++i)
        futures.push_back(omc::core::submit(pool.get_executor(), [i] { return i * i; }));
    int sum = 0;
    for (auto& f : futures)
        sum += f.get();
    EXPECT_EQ(sum, 10416);
}

TEST(WorkerPoolTest, ExceptionsReachTheFuture) {
    WorkerPool pool(2);
    auto f = omc::core::submit(pool.get_executor(),
                               []() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(WorkerPoolTest, DefaultThreadCountIsBounded) {
    auto n = WorkerPool::defaultThreads();
    EXPECT_GE(n, 2u);
    EXPECT_LE(n, 16u);
}

TEST(WorkerPoolTest, VoidTasksRun) {
    std::atomic<int> counter{0};
    {
        WorkerPool pool(2);
        std::vector<std::future<void>> futures;
        for (int i = 0; i < 10; ++i)
            futures.push_back(omc::core::submit(pool.get_executor(), [&] { ++counter; }));
        for (auto& f : futures)
            f.get();
    }
    EXPECT_EQ(counter.load(), 10);
}
