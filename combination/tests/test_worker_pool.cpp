#include <gtest/gtest.h>
#include "combination/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace combination;

class WorkerPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        pool = std::make_unique<WorkerPool>(4);
    }

    void TearDown() override {
        pool->shutdown();
        pool.reset();
    }

    std::unique_ptr<WorkerPool> pool;
};

TEST_F(WorkerPoolTest, BasicJobExecution) {
    std::atomic<int> counter{0};

    pool->start();
    pool->submit(make_job([&counter]() {
        counter.fetch_add(1);
    }));
    pool->wait_for_completion();

    EXPECT_EQ(counter.load(), 1);
    EXPECT_FALSE(pool->has_error());
}

TEST_F(WorkerPoolTest, MultipleJobsExecution) {
    std::atomic<int> counter{0};
    const int num_jobs = 100;

    pool->start();
    for (int i = 0; i < num_jobs; ++i) {
        pool->submit_function([&counter]() {
            counter.fetch_add(1);
        });
    }
    pool->wait_for_completion();

    EXPECT_EQ(counter.load(), num_jobs);
    EXPECT_TRUE(pool->is_idle());
    EXPECT_EQ(pool->get_pending_count(), 0u);
}

TEST_F(WorkerPoolTest, PinnedJobsRunOnTheirWorkerInOrder) {
    std::vector<int> execution_order;
    std::set<std::thread::id> threads;
    std::mutex order_mutex;

    pool->start();
    for (int i = 0; i < 10; ++i) {
        pool->submit_to_worker(2, make_job([&, i]() {
            std::lock_guard<std::mutex> lock(order_mutex);
            execution_order.push_back(i);
            threads.insert(std::this_thread::get_id());
        }));
    }
    pool->wait_for_completion();

    ASSERT_EQ(execution_order.size(), 10u);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(execution_order[i], i);
    }
    EXPECT_EQ(threads.size(), 1u);
    EXPECT_EQ(pool->get_jobs_executed(2), 10u);
    EXPECT_EQ(pool->get_jobs_executed(0), 0u);
}

TEST_F(WorkerPoolTest, OneJobPerWorkerRunsConcurrently) {
    std::atomic<int> arrived{0};

    pool->start();
    for (size_t w = 0; w < pool->get_num_workers(); ++w) {
        pool->submit_to_worker(w, make_job([&arrived]() {
            arrived.fetch_add(1);
            // Every job waits for all the others: only passes if they overlap
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
            while (arrived.load() < 4 && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::yield();
            }
        }));
    }
    pool->wait_for_completion();

    EXPECT_EQ(arrived.load(), 4);
}

TEST_F(WorkerPoolTest, SubmitBeforeStartThrows) {
    EXPECT_THROW(pool->submit(make_job([]() {})), std::runtime_error);
    EXPECT_THROW(pool->submit_to_worker(0, make_job([]() {})), std::runtime_error);
}

TEST_F(WorkerPoolTest, InvalidWorkerIdThrows) {
    pool->start();
    EXPECT_THROW(pool->submit_to_worker(4, make_job([]() {})), std::out_of_range);
}

TEST_F(WorkerPoolTest, ExceptionIsCapturedAndRethrown) {
    pool->start();
    pool->submit_to_worker(0, make_job([]() {
        throw std::runtime_error("shard failed");
    }));
    pool->wait_for_completion();

    EXPECT_TRUE(pool->has_error());
    EXPECT_EQ(pool->get_error_type(), ErrorType::Exception);
    EXPECT_STREQ(pool->get_error_description(), "Exception thrown");

    try {
        pool->rethrow_if_error();
        FAIL() << "expected rethrow";
    } catch (const std::runtime_error& e) {
        EXPECT_STREQ(e.what(), "shard failed");
    }
}

TEST_F(WorkerPoolTest, OutOfMemoryIsClassified) {
    pool->start();
    pool->submit(make_job([]() {
        throw std::bad_alloc();
    }));
    pool->wait_for_completion();

    EXPECT_EQ(pool->get_error_type(), ErrorType::OutOfMemory);
    EXPECT_THROW(pool->rethrow_if_error(), std::bad_alloc);
}

TEST_F(WorkerPoolTest, NonStandardExceptionIsClassified) {
    pool->start();
    pool->submit(make_job([]() {
        throw 42;
    }));
    pool->wait_for_completion();

    EXPECT_EQ(pool->get_error_type(), ErrorType::Unhandled);
    EXPECT_THROW(pool->rethrow_if_error(), int);
}

TEST_F(WorkerPoolTest, ErrorDropsQueuedJobs) {
    std::atomic<int> ran{0};

    pool->start();
    pool->submit_to_worker(1, make_job([]() {
        throw std::logic_error("first");
    }));
    for (int i = 0; i < 5; ++i) {
        pool->submit_to_worker(1, make_job([&ran]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ran.fetch_add(1);
        }));
    }

    // Must return even though the queued jobs never run
    pool->wait_for_completion();
    EXPECT_TRUE(pool->has_error());
    EXPECT_LT(ran.load(), 5);
}

TEST_F(WorkerPoolTest, WaitWithAbortReturnsWhenIdle) {
    pool->start();
    pool->submit_function([]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    });

    bool aborted = pool->wait_for_completion_with_abort([]() { return false; },
                                                        std::chrono::milliseconds(5));
    EXPECT_FALSE(aborted);
    EXPECT_TRUE(pool->is_idle());
}

TEST_F(WorkerPoolTest, WaitWithAbortHonorsCheck) {
    std::atomic<bool> release{false};

    pool->start();
    pool->submit_function([&release]() {
        while (!release.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    });

    int polls = 0;
    bool aborted = pool->wait_for_completion_with_abort([&polls]() { return ++polls >= 3; },
                                                        std::chrono::milliseconds(5));
    EXPECT_TRUE(aborted);
    EXPECT_GE(polls, 3);

    release.store(true);
    pool->wait_for_completion();
}

TEST_F(WorkerPoolTest, RestartAfterShutdown) {
    std::atomic<int> counter{0};

    pool->start();
    pool->submit_function([&counter]() { counter.fetch_add(1); });
    pool->wait_for_completion();
    pool->shutdown();
    EXPECT_FALSE(pool->is_running());

    pool->start();
    pool->submit_function([&counter]() { counter.fetch_add(1); });
    pool->wait_for_completion();
    EXPECT_EQ(counter.load(), 2);
}
