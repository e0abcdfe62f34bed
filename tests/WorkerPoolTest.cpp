#include <atomic>    // std::atomic
#include <chrono>    // std::chrono::milliseconds
#include <latch>     // std::latch
#include <stdexcept> // std::runtime_error
#include <thread>    // std::this_thread::sleep_for

#include <Almanac/Utils/WorkerPool.hpp>
#include <Almanac/Utils/Types.hpp>

#include "gtest/gtest.h"

using almanac::utils::concurrency::WorkerPool;
using almanac::utils::types::i32;
using almanac::utils::types::Unit;
using almanac::utils::types::usize;

class WorkerPoolTest : public testing::Test {};

TEST_F(WorkerPoolTest, ZeroWidthStillRunsJobs) {
  WorkerPool pool(0);

  EXPECT_EQ(pool.size(), 1U);

  std::latch done(1);

  ASSERT_TRUE(pool.submit([&done]() -> Unit { done.count_down(); }).has_value());

  done.wait();
}

TEST_F(WorkerPoolTest, RunsEverySubmittedJob) {
  WorkerPool pool(5);

  constexpr i32 JOBS = 50;

  std::atomic<i32> counter = 0;
  std::latch       done(JOBS);

  for (i32 i = 0; i < JOBS; ++i)
    ASSERT_TRUE(pool.submit([&counter, &done]() -> Unit {
                      counter.fetch_add(1);
                      done.count_down();
                    })
                  .has_value());

  done.wait();

  EXPECT_EQ(counter.load(), JOBS);
}

TEST_F(WorkerPoolTest, NeverRunsMoreJobsThanWorkers) {
  WorkerPool pool(5);

  constexpr i32 JOBS = 20;

  std::atomic<i32> active  = 0;
  std::atomic<i32> highest = 0;
  std::latch       done(JOBS);

  for (i32 i = 0; i < JOBS; ++i)
    ASSERT_TRUE(pool.submit([&]() -> Unit {
                      const i32 now = active.fetch_add(1) + 1;

                      i32 seen = highest.load();
                      while (now > seen && !highest.compare_exchange_weak(seen, now)) {}

                      std::this_thread::sleep_for(std::chrono::milliseconds(10));

                      active.fetch_sub(1);
                      done.count_down();
                    })
                  .has_value());

  done.wait();

  EXPECT_LE(highest.load(), 5);
  EXPECT_GE(highest.load(), 1);
}

TEST_F(WorkerPoolTest, ThrowingJobDoesNotKillWorker) {
  WorkerPool pool(1);

  std::latch done(1);

  ASSERT_TRUE(pool.submit([]() -> Unit { throw std::runtime_error("boom"); }).has_value());
  ASSERT_TRUE(pool.submit([&done]() -> Unit { done.count_down(); }).has_value());

  done.wait();
}

TEST_F(WorkerPoolTest, DestructorDiscardsQueuedJobs) {
  std::atomic<i32> ran = 0;

  {
    WorkerPool pool(1);
    std::latch started(1);

    ASSERT_TRUE(pool.submit([&]() -> Unit {
                      started.count_down();
                      std::this_thread::sleep_for(std::chrono::milliseconds(50));
                      ran.fetch_add(1);
                    })
                  .has_value());

    started.wait();

    for (usize i = 0; i < 10; ++i)
      ASSERT_TRUE(pool.submit([&ran]() -> Unit { ran.fetch_add(1); }).has_value());

    EXPECT_EQ(pool.pending(), 10U);
  }

  EXPECT_EQ(ran.load(), 1);
}
