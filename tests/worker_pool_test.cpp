/**
 * @file worker_pool_test.cpp
 * @brief 弹性工作线程池
 */

#include <gtest/gtest.h>

#include <set>
#include <thread>
#include <chrono>
#include <functional>
#include <stdexcept>

#include "engine/worker_pool.h"

using namespace sj;
using namespace sj::engine;

namespace {

bool wait_until(const std::function<bool()> &pred, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

} // namespace

class WorkerPoolTest : public ::testing::Test {
protected:
    SubmissionQueue queue{2};
    WorkerPoolOptions options;
    std::mutex mutex;
    std::set<std::string> processed;
    std::vector<std::pair<std::string, std::string>> exhausted;
    std::chrono::milliseconds work_time{0};

    void SetUp() override {
        options.min_workers = 2;
        options.max_workers = 4;
        options.scale_up_queue_depth = 2;
        options.idle_timeout = std::chrono::milliseconds(100);
        options.supervisor_interval = std::chrono::milliseconds(10);
        options.poll_interval = std::chrono::milliseconds(10);
    }

    std::unique_ptr<WorkerPool> make_pool() {
        return std::unique_ptr<WorkerPool>(new WorkerPool(
            queue,
            [this](const Claim &claim, const std::string &) {
                if (claim.submission_id.find("bad") == 0) {
                    throw std::runtime_error("boom");
                }
                if (work_time.count() > 0) {
                    std::this_thread::sleep_for(work_time);
                }
                {
                    std::lock_guard<std::mutex> lock(mutex);
                    processed.insert(claim.submission_id);
                }
                queue.ack(claim.submission_id);
            },
            options,
            [this](const std::string &id, const std::string &reason) {
                std::lock_guard<std::mutex> lock(mutex);
                exhausted.emplace_back(id, reason);
            }));
    }

    size_t processed_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return processed.size();
    }

    void enqueue_n(int n, const std::string &prefix = "s") {
        for (int i = 0; i < n; i++) {
            ASSERT_TRUE(queue.enqueue(prefix + std::to_string(i)).ok());
        }
    }
};

TEST_F(WorkerPoolTest, ProcessesEveryItemOnce) {
    auto pool = make_pool();
    pool->start();
    EXPECT_EQ(pool->total_workers(), 2u);

    enqueue_n(20);
    ASSERT_TRUE(wait_until([&] { return processed_count() == 20; }));
    EXPECT_EQ(queue.claimed_count(), 0u);
    EXPECT_EQ(queue.depth(), 0u);
    pool->stop();
    EXPECT_EQ(pool->completed(), 20u);
    EXPECT_EQ(pool->active_workers(), 0u);
}

// 测试：队列积压时扩容，空闲后回落到 min
TEST_F(WorkerPoolTest, ScalesUpThenRetiresIdleWorkers) {
    options.min_workers = 1;
    work_time = std::chrono::milliseconds(50);
    auto pool = make_pool();
    pool->start();

    enqueue_n(20);
    EXPECT_TRUE(wait_until([&] { return pool->total_workers() > 1; }));
    EXPECT_LE(pool->total_workers(), 4u);

    ASSERT_TRUE(wait_until([&] { return processed_count() == 20; }, 5000));
    EXPECT_TRUE(wait_until([&] { return pool->total_workers() == 1; }));
}

TEST_F(WorkerPoolTest, ZeroMinimumSpawnsOnDemand) {
    options.min_workers = 0;
    options.scale_up_queue_depth = 100;
    auto pool = make_pool();
    pool->start();
    EXPECT_EQ(pool->total_workers(), 0u);

    enqueue_n(1);
    ASSERT_TRUE(wait_until([&] { return processed_count() == 1; }));
    EXPECT_TRUE(wait_until([&] { return pool->total_workers() == 0; }));
}

TEST_F(WorkerPoolTest, CrashRequeuesThenReportsExhausted) {
    auto pool = make_pool();
    pool->start();
    ASSERT_TRUE(queue.enqueue("bad-1").ok());
    enqueue_n(3);

    ASSERT_TRUE(wait_until([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return !exhausted.empty() && processed.size() == 3;
    }));
    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(exhausted.size(), 1u);
    EXPECT_EQ(exhausted[0].first, "bad-1");
    EXPECT_EQ(exhausted[0].second, "boom");
    EXPECT_FALSE(queue.is_claimed("bad-1"));
    EXPECT_EQ(queue.position("bad-1"), -1);
}

TEST_F(WorkerPoolTest, StopLeavesQueuedItems) {
    options.min_workers = 1;
    options.max_workers = 1;
    work_time = std::chrono::milliseconds(30);
    auto pool = make_pool();
    pool->start();
    enqueue_n(50);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    pool->stop();
    EXPECT_LT(processed_count(), 50u);
    EXPECT_GT(queue.depth(), 0u);
    EXPECT_EQ(queue.claimed_count(), 0u);
}

TEST(WorkerPoolOptionsTest, FromConfig) {
    WorkersConfig cfg;
    cfg.min = 3;
    cfg.max = 6;
    cfg.scale_up_queue_depth = 9;
    cfg.idle_timeout_ms = 1234;
    WorkerPoolOptions o = WorkerPoolOptions::from(cfg);
    EXPECT_EQ(o.min_workers, 3);
    EXPECT_EQ(o.max_workers, 6);
    EXPECT_EQ(o.scale_up_queue_depth, 9);
    EXPECT_EQ(o.idle_timeout.count(), 1234);
    EXPECT_EQ(o.supervisor_interval.count(), 100);
}
