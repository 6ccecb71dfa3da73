/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <qtils/shared_ref.hpp>

#include "executor/executor.hpp"
#include "utils/ctor_limiters.hpp"

namespace soralog {
  class Logger;
}  // namespace soralog

namespace chime::log {
  class LoggingSystem;
}  // namespace chime::log

namespace chime::executor {

  /**
   * Fixed set of worker threads sharing one io_context queue.
   * Workers are named `<name>.<n>`. Workers co-own the queue, so the pool may
   * be destroyed by one of its own jobs.
   */
  class ThreadPool final : public Executor, NonCopyable, NonMovable {
   public:
    ThreadPool(qtils::SharedRef<log::LoggingSystem> logsys,
               size_t thread_count,
               std::string name = "pool");

    ~ThreadPool() override;

    void execute(Job &&job) override;

    /// Lets queued jobs finish and joins the workers, unless called from a
    /// job of this pool. Jobs submitted later are dropped
    void dispose();

    size_t size() const {
      return workers_.size();
    }

    /// @return true if called from one of the workers of this pool
    bool isInPool() const;

   private:
    using IoContext = boost::asio::io_context;

    static void work(const std::shared_ptr<IoContext> &io_context,
                     const qtils::SharedRef<soralog::Logger> &logger,
                     const std::string &thread_name);

    qtils::SharedRef<soralog::Logger> logger_;
    const std::string name_;
    std::shared_ptr<IoContext> io_context_;
    std::mutex mutex_;
    std::optional<boost::asio::executor_work_guard<IoContext::executor_type>>
        work_guard_;
    bool disposed_ = false;
    std::vector<std::thread> workers_;
  };

}  // namespace chime::executor
