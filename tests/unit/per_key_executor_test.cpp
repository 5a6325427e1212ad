#include <gtest/gtest.h>
#include "per_key_executor.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

TEST(WorkerPoolTest, ReturnsTaskResults) {
    WorkerPool pool(2, "test");

    auto a = pool.submit([]() { return 40 + 2; });
    auto b = pool.submit([]() { return std::string("done"); });

    EXPECT_EQ(a.get(), 42);
    EXPECT_EQ(b.get(), "done");
    EXPECT_EQ(pool.threadCount(), 2);
}

TEST(WorkerPoolTest, ExceptionsTravelThroughFuture) {
    WorkerPool pool(1);

    auto result = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(result.get(), std::runtime_error);

    // The worker survives a throwing task
    EXPECT_EQ(pool.submit([]() { return 1; }).get(), 1);
}

TEST(WorkerPoolTest, SingleThreadRunsInSubmissionOrder) {
    WorkerPool pool(1);
    std::vector<int> order;

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 50; ++i) {
        futures.push_back(pool.submit([&order, i]() { order.push_back(i); }));
    }
    for (auto& f : futures) {
        f.get();
    }

    ASSERT_EQ(order.size(), 50);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(order[i], i);
    }
}

TEST(WorkerPoolTest, ShutdownDrainsQueueAndRejectsNewTasks) {
    WorkerPool pool(1);
    std::atomic<int> completed{0};

    for (int i = 0; i < 10; ++i) {
        pool.submit([&completed]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
            completed++;
        });
    }

    pool.shutdown();
    EXPECT_EQ(completed.load(), 10);
    EXPECT_THROW(pool.submit([]() {}), std::runtime_error);

    // Idempotent
    pool.shutdown();
}

class PerKeyExecutorTest : public ::testing::Test {
protected:
    PerKeyExecutor executor_{4};

    // Two keys that share a bucket
    std::pair<std::string, std::string> collidingKeys() {
        std::string first = "key_0";
        for (int i = 1; i < 1000; ++i) {
            std::string candidate = "key_" + std::to_string(i);
            if (executor_.bucketFor(candidate) == executor_.bucketFor(first)) {
                return {first, candidate};
            }
        }
        ADD_FAILURE() << "no colliding keys found";
        return {first, first};
    }
};

TEST_F(PerKeyExecutorTest, BucketIsStableAndInRange) {
    for (int i = 0; i < 100; ++i) {
        std::string key = "key_" + std::to_string(i);
        size_t bucket = executor_.bucketFor(key);
        EXPECT_LT(bucket, executor_.workerCount());
        EXPECT_EQ(bucket, executor_.bucketFor(key));
    }
}

TEST_F(PerKeyExecutorTest, SameKeyTasksNeverOverlap) {
    std::atomic<int> active{0};
    std::atomic<int> max_active{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(executor_.submit("hot", [&]() {
            int now = ++active;
            int seen = max_active.load();
            while (now > seen && !max_active.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            --active;
        }));
    }
    for (auto& f : futures) {
        f.get();
    }

    EXPECT_EQ(max_active.load(), 1);
}

TEST_F(PerKeyExecutorTest, DistinctKeysInSameBucketAreSerialized) {
    auto [first, second] = collidingKeys();

    std::mutex order_mutex;
    std::vector<std::string> order;

    // The first task blocks its bucket; the second key has to wait behind it
    auto slow = executor_.submit(first, [&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        std::lock_guard<std::mutex> lock(order_mutex);
        order.push_back(first);
    });
    auto fast = executor_.submit(second, [&]() {
        std::lock_guard<std::mutex> lock(order_mutex);
        order.push_back(second);
    });

    slow.get();
    fast.get();

    ASSERT_EQ(order.size(), 2);
    EXPECT_EQ(order[0], first);
    EXPECT_EQ(order[1], second);
}

TEST_F(PerKeyExecutorTest, DifferentBucketsRunConcurrently) {
    std::string first = "key_0";
    std::string other;
    for (int i = 1; i < 1000 && other.empty(); ++i) {
        std::string candidate = "key_" + std::to_string(i);
        if (executor_.bucketFor(candidate) != executor_.bucketFor(first)) {
            other = candidate;
        }
    }
    ASSERT_FALSE(other.empty());

    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();

    auto blocked = executor_.submit(first, [released]() { released.wait(); });
    auto independent = executor_.submit(other, []() { return true; });

    // Completes while the first bucket is still blocked
    ASSERT_EQ(independent.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_TRUE(independent.get());

    release.set_value();
    blocked.get();
}
