/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <latch>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "executor/impl/thread_pool.hpp"
#include "testutil/prepare_loggers.hpp"

using chime::executor::ThreadPool;
using namespace std::chrono_literals;

class ThreadPoolTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  qtils::SharedRef<chime::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
};

/**
 * @given pool of 3 threads
 * @when 3 jobs wait for each other
 * @then all of them run concurrently on different pool threads
 */
TEST_F(ThreadPoolTest, JobsRunConcurrently) {
  ThreadPool pool(logsys, 3);
  ASSERT_EQ(pool.size(), 3);

  std::latch all_started(3);
  std::latch all_done(3);
  std::mutex mutex;
  std::set<std::thread::id> ids;
  for (int i = 0; i < 3; ++i) {
    pool.execute([&] {
      {
        std::lock_guard lock(mutex);
        ids.emplace(std::this_thread::get_id());
      }
      all_started.arrive_and_wait();
      all_done.count_down();
    });
  }
  all_done.wait();

  EXPECT_EQ(ids.size(), 3);
  EXPECT_FALSE(ids.contains(std::this_thread::get_id()));
}

/**
 * @given pool
 * @when checking from a job and from the test thread
 * @then only the job is reported as running in the pool
 */
TEST_F(ThreadPoolTest, IsInPool) {
  ThreadPool pool(logsys, 1);
  std::promise<bool> in_pool;
  pool.execute([&] { in_pool.set_value(pool.isInPool()); });

  EXPECT_TRUE(in_pool.get_future().get());
  EXPECT_FALSE(pool.isInPool());
}

/**
 * @given pool of one thread
 * @when a job throws
 * @then the worker survives and runs the next job
 */
TEST_F(ThreadPoolTest, ThrowingJobDoesNotKillWorker) {
  ThreadPool pool(logsys, 1);
  pool.execute([] { throw std::runtime_error("job failure"); });

  std::promise<void> done;
  pool.execute([&] { done.set_value(); });
  EXPECT_EQ(done.get_future().wait_for(5s), std::future_status::ready);
}

/**
 * @given pool with queued jobs
 * @when it is disposed
 * @then queued jobs are finished, and jobs submitted later are dropped
 */
TEST_F(ThreadPoolTest, Dispose) {
  ThreadPool pool(logsys, 1);
  std::atomic_int counter = 0;
  for (int i = 0; i < 10; ++i) {
    pool.execute([&] {
      std::this_thread::sleep_for(1ms);
      ++counter;
    });
  }
  pool.dispose();
  EXPECT_EQ(counter.load(), 10);

  pool.execute([&] { ++counter; });
  pool.dispose();
  EXPECT_EQ(counter.load(), 10);
}

/**
 * @given threads submitting jobs while the pool is being disposed
 * @when dispose() returns and the submitters are done
 * @then every job is either run or dropped, none is left in the queue
 */
TEST_F(ThreadPoolTest, DisposeRacesWithExecute) {
  for (int attempt = 0; attempt < 20; ++attempt) {
    ThreadPool pool(logsys, 2);
    auto sentinel = std::make_shared<int>(0);
    std::atomic_int executed = 0;
    std::latch start(4);

    std::vector<std::thread> submitters;
    for (int i = 0; i < 3; ++i) {
      submitters.emplace_back([&, sentinel] {
        start.arrive_and_wait();
        for (int j = 0; j < 200; ++j) {
          pool.execute([&executed, sentinel] { ++executed; });
        }
      });
    }
    start.arrive_and_wait();
    pool.dispose();
    for (auto &submitter : submitters) {
      submitter.join();
    }

    // Jobs own copies of the sentinel until they are run or destroyed
    EXPECT_EQ(sentinel.use_count(), 1);
    EXPECT_LE(executed.load(), 600);
  }
}

/**
 * @given pool owned by a shared pointer
 * @when one of its jobs releases the last reference to the pool
 * @then the pool is destroyed safely and the queue is finished
 */
TEST_F(ThreadPoolTest, DestroyedByOwnJob) {
  auto pool = std::make_shared<ThreadPool>(logsys, 2);
  std::promise<void> released;
  std::promise<void> next_job_done;
  auto next_job_future = next_job_done.get_future();

  std::weak_ptr<ThreadPool> weak = pool;
  pool->execute([&, pool] () mutable {
    std::this_thread::sleep_for(10ms);
    pool.reset();
    released.set_value();
  });
  pool->execute([&] { next_job_done.set_value(); });
  pool.reset();

  ASSERT_EQ(released.get_future().wait_for(5s), std::future_status::ready);
  EXPECT_EQ(next_job_future.wait_for(5s), std::future_status::ready);
  EXPECT_TRUE(weak.expired());
}
