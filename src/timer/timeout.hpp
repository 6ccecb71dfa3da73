/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>

namespace chime::timer {

  class Timeout;

  using TimeoutPtr = std::shared_ptr<Timeout>;

  /// Work scheduled on a timer. Receives the handle of the timeout that
  /// fired it. May throw.
  using TimerTask = std::function<void(const TimeoutPtr &)>;

  /**
   * Handle of a one-shot registration made by Timer::newTimeout.
   * Becomes inert once expired or cancelled.
   */
  class Timeout {
   public:
    virtual ~Timeout() = default;

    /// @return true if the task of this timeout has been fired
    [[nodiscard]] virtual bool isExpired() const = 0;

    /// @return true if this timeout was cancelled before firing
    [[nodiscard]] virtual bool isCancelled() const = 0;

    /**
     * Cancels the timeout. The task will never be fired after that.
     * No-op for an expired or already cancelled timeout.
     * @return true if this call cancelled the timeout
     */
    virtual bool cancel() = 0;
  };

}  // namespace chime::timer
