/**
 * @file test_thread_pool_adapter.cpp
 * @brief Unit tests for the executor's worker pool adapters
 */

#include <gtest/gtest.h>

#include <kcenon/transfer_engine/adapters/thread_pool_adapter.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace kcenon::transfer_engine::test {

using adapters::async_transfer_pool;
using adapters::transfer_pool_factory;

class ThreadPoolAdapterTest : public ::testing::Test {};

TEST_F(ThreadPoolAdapterTest, FactoryCreatesRunningPool) {
    auto pool = transfer_pool_factory::create(3, "test_pool");
    ASSERT_NE(pool, nullptr);
    EXPECT_TRUE(pool->is_running());
    EXPECT_EQ(pool->worker_count(), 3u);
}

TEST_F(ThreadPoolAdapterTest, AutoDetectWorkerCount) {
    async_transfer_pool pool(0);
    EXPECT_GT(pool.worker_count(), 0u);
}

TEST_F(ThreadPoolAdapterTest, SubmitRunsTask) {
    auto pool = transfer_pool_factory::create(2);
    std::atomic<int> counter{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool->submit([&counter] { counter.fetch_add(1); }));
    }
    for (auto& f : futures) {
        f.get();
    }
    EXPECT_EQ(counter.load(), 10);
}

TEST_F(ThreadPoolAdapterTest, ExceptionPropagatesThroughFuture) {
    auto pool = transfer_pool_factory::create(1);
    auto future = pool->submit([] { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST_F(ThreadPoolAdapterTest, StageCountsTrackRunningTasks) {
    async_transfer_pool pool(2);

    std::mutex mutex;
    std::condition_variable cv;
    bool release = false;
    std::atomic<int> started{0};

    auto blocked = [&] {
        started.fetch_add(1);
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [&] { return release; });
    };

    auto first = pool.submit_to_stage(blocked, "transfer_worker");
    auto second = pool.submit_to_stage(blocked, "transfer_worker");

    while (started.load() < 2) {
        std::this_thread::yield();
    }
    EXPECT_EQ(pool.pending_tasks("transfer_worker"), 2u);
    EXPECT_EQ(pool.pending_tasks("other"), 0u);
    EXPECT_EQ(pool.pending_tasks(), 2u);

    {
        std::lock_guard<std::mutex> lock(mutex);
        release = true;
    }
    cv.notify_all();
    first.get();
    second.get();

    EXPECT_EQ(pool.pending_tasks("transfer_worker"), 0u);
    EXPECT_EQ(pool.pending_tasks(), 0u);
}

TEST_F(ThreadPoolAdapterTest, StageCountReleasedOnException) {
    async_transfer_pool pool(1);
    auto future = pool.submit_to_stage([] { throw std::runtime_error("fail"); }, "stage");
    EXPECT_THROW(future.get(), std::runtime_error);
    EXPECT_EQ(pool.pending_tasks("stage"), 0u);
}

TEST_F(ThreadPoolAdapterTest, ThreadSystemAvailability) {
#if KCENON_WITH_THREAD_SYSTEM
    EXPECT_TRUE(transfer_pool_factory::has_thread_system());
#else
    EXPECT_FALSE(transfer_pool_factory::has_thread_system());
#endif
}

}  // namespace kcenon::transfer_engine::test
