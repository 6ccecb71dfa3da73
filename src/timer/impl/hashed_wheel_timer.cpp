/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "timer/impl/hashed_wheel_timer.hpp"

#include <algorithm>
#include <atomic>
#include <bit>
#include <condition_variable>
#include <limits>
#include <list>
#include <mutex>
#include <optional>
#include <tuple>
#include <utility>

#include <qtils/outcome.hpp>
#include <soralog/util.hpp>

#include "log/logger.hpp"
#include "timer/timer_error.hpp"

namespace chime::timer {

  namespace {

    class WheelTimeout;
    using WheelTimeoutPtr = std::shared_ptr<WheelTimeout>;
    using Bucket = std::list<WheelTimeoutPtr>;

    /// Cancelled timeouts waiting to be released by the worker.
    /// Shared with the timeouts, so they never keep the wheel itself alive.
    struct CancelQueue {
      std::mutex mutex;
      bool closed = false;
      std::vector<WheelTimeoutPtr> timeouts;

      void push(WheelTimeoutPtr timeout) {
        std::lock_guard lock(mutex);
        if (closed) {
          return;
        }
        timeouts.emplace_back(std::move(timeout));
      }

      std::vector<WheelTimeoutPtr> take() {
        std::lock_guard lock(mutex);
        return std::exchange(timeouts, {});
      }

      void close() {
        std::lock_guard lock(mutex);
        closed = true;
        timeouts.clear();
      }
    };

    class WheelTimeout final
        : public Timeout,
          public std::enable_shared_from_this<WheelTimeout> {
     public:
      enum class State : uint8_t { Init, Cancelled, Expired };

      WheelTimeout(std::shared_ptr<CancelQueue> cancelled,
                   TimerTask task,
                   std::chrono::nanoseconds deadline)
          : deadline(deadline),
            cancelled_(std::move(cancelled)),
            task_(std::move(task)) {}

      bool isExpired() const override {
        return state_.load() == State::Expired;
      }

      bool isCancelled() const override {
        return state_.load() == State::Cancelled;
      }

      bool cancel() override {
        auto expected = State::Init;
        if (not state_.compare_exchange_strong(expected, State::Cancelled)) {
          return false;
        }
        task_ = nullptr;
        cancelled_->push(shared_from_this());
        return true;
      }

      /// Fires the task unless the timeout has been cancelled
      void expire(const log::Logger &logger) {
        auto expected = State::Init;
        if (not state_.compare_exchange_strong(expected, State::Expired)) {
          return;
        }
        auto task = std::move(task_);
        try {
          task(shared_from_this());
        } catch (const std::exception &e) {
          SL_WARN(
              logger, "An exception was thrown by timer task: {}", e.what());
        }
      }

      // Owned by the worker thread
      const std::chrono::nanoseconds deadline;
      int64_t remaining_rounds = 0;
      Bucket *bucket = nullptr;
      Bucket::iterator position;

     private:
      std::atomic<State> state_ = State::Init;
      std::shared_ptr<CancelQueue> cancelled_;
      TimerTask task_;
    };

    std::chrono::nanoseconds checkTickDuration(
        std::chrono::nanoseconds tick_duration) {
      if (tick_duration <= std::chrono::nanoseconds::zero()) {
        qtils::raise(TimerError::INVALID_TICK_DURATION);
      }
      return tick_duration;
    }

    size_t normalizeTicksPerWheel(size_t ticks_per_wheel) {
      if (ticks_per_wheel == 0
          or ticks_per_wheel > HashedWheelTimer::kMaxTicksPerWheel) {
        qtils::raise(TimerError::INVALID_TICKS_PER_WHEEL);
      }
      return std::bit_ceil(ticks_per_wheel);
    }

  }  // namespace

  /// State of the timer shared by its handle and its worker thread
  class HashedWheelTimer::Wheel {
   public:
    enum class State : uint8_t { Started, Shutdown };

    Wheel(log::Logger logger,
          std::chrono::nanoseconds tick_duration,
          size_t ticks_per_wheel)
        : tick_duration(checkTickDuration(tick_duration)),
          logger_(std::move(logger)),
          buckets_(normalizeTicksPerWheel(ticks_per_wheel)),
          mask_(buckets_.size() - 1),
          start_time_(std::chrono::steady_clock::now()),
          cancelled_(std::make_shared<CancelQueue>()) {
      // Prevent overflow of the tick counter converted to time
      if (this->tick_duration.count()
          >= std::numeric_limits<int64_t>::max()
                 / static_cast<int64_t>(buckets_.size())) {
        qtils::raise(TimerError::TICK_DURATION_TOO_LONG);
      }
    }

    outcome::result<TimeoutPtr> add(TimerTask task,
                                    std::chrono::nanoseconds delay) {
      using std::chrono::nanoseconds;

      delay = std::max(delay, nanoseconds::zero());
      nanoseconds since_start = std::chrono::steady_clock::now() - start_time_;

      // Guard against overflow
      auto deadline = delay > nanoseconds::max() - since_start
                        ? nanoseconds::max()
                        : since_start + delay;

      auto timeout = std::make_shared<WheelTimeout>(
          cancelled_, std::move(task), deadline);
      {
        std::lock_guard lock(pending_mutex_);
        if (state_.load() == State::Shutdown) {
          return TimerError::TIMER_STOPPED;
        }
        pending_.emplace_back(timeout);
        ++pending_timeouts;
      }

      SL_TRACE(logger_, "New timeout in {}ns", delay.count());
      return TimeoutPtr(std::move(timeout));
    }

    /// @return false if the wheel was already shut down
    bool shutdown() {
      {
        std::lock_guard lock(pending_mutex_);
        if (state_.load() == State::Shutdown) {
          return false;
        }
        state_ = State::Shutdown;
      }
      {
        std::lock_guard lock(wait_mutex_);
      }
      wait_cv_.notify_all();
      return true;
    }

    /// Takes all timeouts which were not fired. The worker must be gone.
    std::vector<TimeoutPtr> drain() {
      std::vector<TimeoutPtr> unprocessed;
      for (auto &bucket : buckets_) {
        for (auto &timeout : bucket) {
          timeout->bucket = nullptr;
          if (not timeout->isCancelled()) {
            unprocessed.emplace_back(timeout);
          }
        }
        bucket.clear();
      }
      {
        std::lock_guard lock(pending_mutex_);
        for (auto &timeout : pending_) {
          if (not timeout->isCancelled()) {
            unprocessed.emplace_back(timeout);
          }
        }
        pending_.clear();
      }
      cancelled_->close();
      pending_timeouts = 0;
      return unprocessed;
    }

    void work(const std::string &thread_name) {
      worker_id = std::this_thread::get_id();
      soralog::util::setThreadName(thread_name);

      while (auto deadline = waitForNextTick()) {
        processCancelledTimeouts();
        transferTimeoutsToBuckets();
        auto &bucket = buckets_[tick_ & mask_];
        expireTimeouts(bucket, *deadline);
        ++tick_;
      }

      worker_id = std::thread::id{};
    }

    size_t size() const {
      return buckets_.size();
    }

    const std::chrono::nanoseconds tick_duration;
    std::atomic_size_t pending_timeouts = 0;
    std::atomic<std::thread::id> worker_id;

   private:
    /// Sleeps until the end of the current tick
    /// @return time since start, or nullopt if the timer was stopped
    std::optional<std::chrono::nanoseconds> waitForNextTick() {
      const auto tick_end =
          start_time_ + tick_duration * static_cast<int64_t>(tick_ + 1);

      std::unique_lock lock(wait_mutex_);
      if (wait_cv_.wait_until(lock, tick_end, [this] {
            return state_.load() == State::Shutdown;
          })) {
        return std::nullopt;
      }
      return std::chrono::steady_clock::now() - start_time_;
    }

    void transferTimeoutsToBuckets() {
      std::vector<WheelTimeoutPtr> pending;
      {
        std::lock_guard lock(pending_mutex_);
        pending.swap(pending_);
      }

      const auto size = static_cast<int64_t>(buckets_.size());
      const auto tick = static_cast<int64_t>(tick_);
      for (auto &timeout : pending) {
        if (timeout->isCancelled()) {
          --pending_timeouts;
          continue;
        }

        const int64_t calculated = timeout->deadline / tick_duration;
        timeout->remaining_rounds = (calculated - tick) / size;

        // Deadline in the past is scheduled into the current tick
        const auto ticks = std::max(calculated, tick);
        auto &bucket = buckets_[static_cast<size_t>(ticks) & mask_];
        timeout->position = bucket.insert(bucket.end(), timeout);
        timeout->bucket = &bucket;
      }
    }

    void processCancelledTimeouts() {
      for (auto &timeout : cancelled_->take()) {
        remove(timeout);
      }
    }

    void expireTimeouts(Bucket &bucket, std::chrono::nanoseconds deadline) {
      for (auto it = bucket.begin(); it != bucket.end();) {
        auto timeout = *it;
        if (timeout->remaining_rounds <= 0) {
          // Due: its deadline is within the tick which has just ended
          ++it;
          remove(timeout);
          if (timeout->deadline <= deadline) {
            timeout->expire(logger_);
          } else {
            SL_WARN(logger_,
                    "Timeout deadline {}ns is past the tick deadline {}ns; "
                    "rescheduled",
                    timeout->deadline.count(),
                    deadline.count());
            std::lock_guard lock(pending_mutex_);
            pending_.emplace_back(std::move(timeout));
            ++pending_timeouts;
          }
        } else if (timeout->isCancelled()) {
          ++it;
          remove(timeout);
        } else {
          --timeout->remaining_rounds;
          ++it;
        }
      }
    }

    void remove(const WheelTimeoutPtr &timeout) {
      if (timeout->bucket == nullptr) {
        return;
      }
      timeout->bucket->erase(timeout->position);
      timeout->bucket = nullptr;
      --pending_timeouts;
    }

    log::Logger logger_;

    std::vector<Bucket> buckets_;
    const size_t mask_;

    const std::chrono::steady_clock::time_point start_time_;
    uint64_t tick_ = 0;

    std::atomic<State> state_ = State::Started;

    std::mutex pending_mutex_;
    std::vector<WheelTimeoutPtr> pending_;

    std::shared_ptr<CancelQueue> cancelled_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
  };

  HashedWheelTimer::HashedWheelTimer(
      qtils::SharedRef<log::LoggingSystem> logsys,
      std::chrono::nanoseconds tick_duration,
      size_t ticks_per_wheel,
      std::string thread_name)
      : logger_(logsys->getLogger("HashedWheelTimer", "timer")),
        wheel_(std::make_shared<Wheel>(
            logger_, tick_duration, ticks_per_wheel)) {
    worker_ = std::thread(
        [wheel{wheel_}, name{std::move(thread_name)}] { wheel->work(name); });

    SL_DEBUG(logger_,
             "Timer started: tick={}ns, wheel size={}",
             wheel_->tick_duration.count(),
             wheel_->size());
  }

  HashedWheelTimer::~HashedWheelTimer() {
    if (isTimerThread()) {
      SL_DEBUG(logger_, "Timer is destroyed by a task it fires");
      wheel_->shutdown();
      worker_.detach();
      return;
    }
    std::ignore = stop();
  }

  outcome::result<TimeoutPtr> HashedWheelTimer::newTimeout(
      TimerTask task, std::chrono::nanoseconds delay) {
    return wheel_->add(std::move(task), delay);
  }

  outcome::result<std::vector<TimeoutPtr>> HashedWheelTimer::stop() {
    if (isTimerThread()) {
      return TimerError::STOP_FROM_TIMER_THREAD;
    }

    if (not wheel_->shutdown()) {
      return std::vector<TimeoutPtr>{};
    }

    if (worker_.joinable()) {
      worker_.join();
    }

    // Worker is gone; buckets may be touched from here
    auto unprocessed = wheel_->drain();

    SL_DEBUG(logger_,
             "Timer stopped; {} unprocessed timeouts dropped",
             unprocessed.size());
    return unprocessed;
  }

  bool HashedWheelTimer::isTimerThread() const {
    return std::this_thread::get_id() == wheel_->worker_id.load();
  }

  size_t HashedWheelTimer::pendingTimeouts() const {
    return wheel_->pending_timeouts.load();
  }

  std::chrono::nanoseconds HashedWheelTimer::tickDuration() const {
    return wheel_->tick_duration;
  }

  size_t HashedWheelTimer::wheelSize() const {
    return wheel_->size();
  }

}  // namespace chime::timer
