/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <functional>
#include <future>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <vector>

#include "testutil/prepare_loggers.hpp"
#include "timer/impl/hashed_wheel_timer.hpp"
#include "timer/timer_error.hpp"

using chime::timer::HashedWheelTimer;
using chime::timer::TimeoutPtr;
using chime::timer::TimerError;
using namespace std::chrono_literals;

class HashedWheelTimerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  std::unique_ptr<HashedWheelTimer> makeTimer(
      std::chrono::nanoseconds tick = 10ms, size_t ticks_per_wheel = 8) {
    return std::make_unique<HashedWheelTimer>(logsys, tick, ticks_per_wheel);
  }

  static std::error_code raisedCode(const std::function<void()> &f) {
    try {
      f();
    } catch (const std::system_error &e) {
      return e.code();
    }
    return {};
  }

  qtils::SharedRef<chime::log::LoggingSystem> logsys =
      testutil::prepareLoggers();
};

/**
 * @given invalid tick duration or wheel size
 * @when constructing a timer
 * @then the corresponding TimerError is raised
 */
TEST_F(HashedWheelTimerTest, InvalidConfiguration) {
  EXPECT_EQ(raisedCode([&] { makeTimer(0ns); }),
            make_error_code(TimerError::INVALID_TICK_DURATION));
  EXPECT_EQ(raisedCode([&] { makeTimer(-1ms); }),
            make_error_code(TimerError::INVALID_TICK_DURATION));
  EXPECT_EQ(raisedCode([&] { makeTimer(10ms, 0); }),
            make_error_code(TimerError::INVALID_TICKS_PER_WHEEL));
  EXPECT_EQ(
      raisedCode([&] {
        makeTimer(10ms, HashedWheelTimer::kMaxTicksPerWheel + 1);
      }),
      make_error_code(TimerError::INVALID_TICKS_PER_WHEEL));
  EXPECT_EQ(raisedCode([&] { makeTimer(std::chrono::nanoseconds::max(), 2); }),
            make_error_code(TimerError::TICK_DURATION_TOO_LONG));
}

/**
 * @given wheel sizes which are or are not powers of two
 * @when constructing a timer
 * @then the wheel size is rounded up to the closest power of two
 */
TEST_F(HashedWheelTimerTest, WheelSizeIsNormalized) {
  EXPECT_EQ(makeTimer(10ms, 1)->wheelSize(), 1);
  EXPECT_EQ(makeTimer(10ms, 5)->wheelSize(), 8);
  EXPECT_EQ(makeTimer(10ms, 512)->wheelSize(), 512);
  EXPECT_EQ(makeTimer(10ms, 513)->wheelSize(), 1024);
}

/**
 * @given running timer
 * @when a task is scheduled with a delay
 * @then it fires on the timer thread, not earlier than the delay
 */
TEST_F(HashedWheelTimerTest, FiresNotEarlierThanDelay) {
  auto timer = makeTimer();
  std::promise<std::chrono::steady_clock::time_point> fired_at;
  std::atomic_bool on_timer_thread = false;

  auto start = std::chrono::steady_clock::now();
  auto res = timer->newTimeout(
      [&](const TimeoutPtr &) {
        on_timer_thread = timer->isTimerThread();
        fired_at.set_value(std::chrono::steady_clock::now());
      },
      50ms);
  ASSERT_TRUE(res.has_value());
  auto timeout = res.value();

  auto future = fired_at.get_future();
  ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
  EXPECT_GE(future.get() - start, 50ms);
  EXPECT_TRUE(on_timer_thread);
  EXPECT_TRUE(timeout->isExpired());
  EXPECT_FALSE(timeout->isCancelled());
  EXPECT_FALSE(timer->isTimerThread());
}

/**
 * @given timer with a wheel revolution of 40ms
 * @when a task is scheduled in 100ms
 * @then it waits for the remaining rounds and fires not earlier than 100ms
 */
TEST_F(HashedWheelTimerTest, DelayLongerThanRevolution) {
  auto timer = makeTimer(10ms, 4);
  std::promise<void> fired;

  auto start = std::chrono::steady_clock::now();
  ASSERT_TRUE(
      timer->newTimeout([&](const TimeoutPtr &) { fired.set_value(); }, 100ms)
          .has_value());

  ASSERT_EQ(fired.get_future().wait_for(5s), std::future_status::ready);
  EXPECT_GE(std::chrono::steady_clock::now() - start, 100ms);
}

/**
 * @given tasks scheduled with different delays in reverse order
 * @when they fire
 * @then they fire in order of their deadlines
 */
TEST_F(HashedWheelTimerTest, FiresInDeadlineOrder) {
  auto timer = makeTimer();
  std::mutex mutex;
  std::vector<int> order;
  std::promise<void> all_fired;

  auto task = [&](int id) {
    return [&, id](const TimeoutPtr &) {
      std::lock_guard lock(mutex);
      order.push_back(id);
      if (order.size() == 3) {
        all_fired.set_value();
      }
    };
  };
  ASSERT_TRUE(timer->newTimeout(task(3), 150ms).has_value());
  ASSERT_TRUE(timer->newTimeout(task(1), 30ms).has_value());
  ASSERT_TRUE(timer->newTimeout(task(2), 90ms).has_value());

  ASSERT_EQ(all_fired.get_future().wait_for(5s), std::future_status::ready);
  EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

/**
 * @given scheduled task
 * @when its timeout is cancelled before the delay elapses
 * @then the task never fires, and only the first cancel reports success
 */
TEST_F(HashedWheelTimerTest, CancelledTaskNeverFires) {
  auto timer = makeTimer();
  std::atomic_bool fired = false;

  auto res = timer->newTimeout([&](const TimeoutPtr &) { fired = true; }, 50ms);
  ASSERT_TRUE(res.has_value());
  auto timeout = res.value();
  EXPECT_EQ(timer->pendingTimeouts(), 1);

  EXPECT_TRUE(timeout->cancel());
  EXPECT_FALSE(timeout->cancel());
  EXPECT_TRUE(timeout->isCancelled());

  std::this_thread::sleep_for(150ms);
  EXPECT_FALSE(fired);
  EXPECT_FALSE(timeout->isExpired());
  EXPECT_EQ(timer->pendingTimeouts(), 0);
}

/**
 * @given fired timeout
 * @when cancelling it
 * @then nothing happens and false is returned
 */
TEST_F(HashedWheelTimerTest, CancelAfterFiring) {
  auto timer = makeTimer();
  std::promise<void> fired;

  auto timeout =
      timer->newTimeout([&](const TimeoutPtr &) { fired.set_value(); }, 10ms)
          .value();
  ASSERT_EQ(fired.get_future().wait_for(5s), std::future_status::ready);

  EXPECT_FALSE(timeout->cancel());
  EXPECT_TRUE(timeout->isExpired());
  EXPECT_FALSE(timeout->isCancelled());
}

/**
 * @given task which throws
 * @when it fires
 * @then the timer keeps working and fires later tasks
 */
TEST_F(HashedWheelTimerTest, ThrowingTaskDoesNotStopTimer) {
  auto timer = makeTimer();
  std::promise<void> fired;

  ASSERT_TRUE(timer
                  ->newTimeout(
                      [](const TimeoutPtr &) {
                        throw std::runtime_error("task failure");
                      },
                      10ms)
                  .has_value());
  ASSERT_TRUE(
      timer->newTimeout([&](const TimeoutPtr &) { fired.set_value(); }, 40ms)
          .has_value());

  EXPECT_EQ(fired.get_future().wait_for(5s), std::future_status::ready);
}

/**
 * @given task scheduled with negative delay
 * @when the next tick comes
 * @then the task fires as if scheduled with zero delay
 */
TEST_F(HashedWheelTimerTest, NegativeDelay) {
  auto timer = makeTimer();
  std::promise<void> fired;

  ASSERT_TRUE(
      timer->newTimeout([&](const TimeoutPtr &) { fired.set_value(); }, -1s)
          .has_value());
  EXPECT_EQ(fired.get_future().wait_for(5s), std::future_status::ready);
}

/**
 * @given task which schedules one more task
 * @when it fires
 * @then the nested task fires too
 */
TEST_F(HashedWheelTimerTest, ScheduleFromTask) {
  auto timer = makeTimer();
  std::promise<void> fired;

  ASSERT_TRUE(timer
                  ->newTimeout(
                      [&](const TimeoutPtr &) {
                        std::ignore = timer->newTimeout(
                            [&](const TimeoutPtr &) { fired.set_value(); },
                            20ms);
                      },
                      10ms)
                  .has_value());
  EXPECT_EQ(fired.get_future().wait_for(5s), std::future_status::ready);
}

/**
 * @given timer with scheduled, cancelled and fired timeouts
 * @when stopping it
 * @then only scheduled ones are returned as unprocessed, later stops return
 * nothing and new timeouts are rejected
 */
TEST_F(HashedWheelTimerTest, Stop) {
  auto timer = makeTimer();
  std::atomic_int fired = 0;
  auto task = [&](const TimeoutPtr &) { ++fired; };

  auto first = timer->newTimeout(task, 10s).value();
  auto second = timer->newTimeout(task, 20s).value();
  auto cancelled = timer->newTimeout(task, 10s).value();
  EXPECT_EQ(timer->pendingTimeouts(), 3);
  ASSERT_TRUE(cancelled->cancel());

  auto res = timer->stop();
  ASSERT_TRUE(res.has_value());
  auto &unprocessed = res.value();
  ASSERT_EQ(unprocessed.size(), 2);
  EXPECT_TRUE(std::ranges::find(unprocessed, first) != unprocessed.end());
  EXPECT_TRUE(std::ranges::find(unprocessed, second) != unprocessed.end());
  EXPECT_EQ(timer->pendingTimeouts(), 0);

  auto again = timer->stop();
  ASSERT_TRUE(again.has_value());
  EXPECT_TRUE(again.value().empty());

  auto rejected = timer->newTimeout(task, 10ms);
  ASSERT_TRUE(rejected.has_error());
  EXPECT_EQ(rejected.error(), TimerError::TIMER_STOPPED);

  // Unprocessed timeouts stay inert
  EXPECT_FALSE(first->isExpired());
  EXPECT_TRUE(first->cancel());
  EXPECT_EQ(fired.load(), 0);
}

/**
 * @given running timer
 * @when a task fired by it tries to stop it
 * @then STOP_FROM_TIMER_THREAD is returned and the timer keeps working
 */
TEST_F(HashedWheelTimerTest, StopFromTimerThread) {
  auto timer = makeTimer();
  std::promise<std::error_code> stop_result;

  ASSERT_TRUE(timer
                  ->newTimeout(
                      [&](const TimeoutPtr &) {
                        auto res = timer->stop();
                        stop_result.set_value(res.has_error() ? res.error()
                                                              : std::error_code{});
                      },
                      10ms)
                  .has_value());

  auto future = stop_result.get_future();
  ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
  EXPECT_EQ(future.get(), make_error_code(TimerError::STOP_FROM_TIMER_THREAD));

  std::promise<void> fired;
  ASSERT_TRUE(
      timer->newTimeout([&](const TimeoutPtr &) { fired.set_value(); }, 10ms)
          .has_value());
  EXPECT_EQ(fired.get_future().wait_for(5s), std::future_status::ready);
}

/**
 * @given running timer
 * @when a task fired by it destroys the timer
 * @then the timer thread finishes safely and the task completes
 */
TEST_F(HashedWheelTimerTest, DestroyedByOwnTask) {
  auto timer = makeTimer();
  std::promise<bool> destroyed;
  auto future = destroyed.get_future();

  auto timeout = timer
                     ->newTimeout(
                         [&](const TimeoutPtr &) {
                           timer.reset();
                           destroyed.set_value(timer == nullptr);
                         },
                         10ms)
                     .value();

  ASSERT_EQ(future.wait_for(5s), std::future_status::ready);
  EXPECT_TRUE(future.get());
  EXPECT_TRUE(timeout->isExpired());

  // Gives the detached timer thread time to leave its loop
  std::this_thread::sleep_for(50ms);
}
