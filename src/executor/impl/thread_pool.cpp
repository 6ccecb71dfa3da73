/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "executor/impl/thread_pool.hpp"

#include <algorithm>

#include <boost/asio/post.hpp>
#include <fmt/format.h>
#include <soralog/util.hpp>

#include "log/logger.hpp"

namespace chime::executor {

  ThreadPool::ThreadPool(qtils::SharedRef<log::LoggingSystem> logsys,
                         size_t thread_count,
                         std::string name)
      : logger_(logsys->getLogger("ThreadPool", "executor")),
        name_(std::move(name)),
        io_context_(std::make_shared<IoContext>(
            static_cast<int>(std::max<size_t>(thread_count, 1)))),
        work_guard_(boost::asio::make_work_guard(*io_context_)) {
    thread_count = std::max<size_t>(thread_count, 1);
    workers_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
      workers_.emplace_back(
          [io_context{io_context_},
           logger{logger_},
           thread_name{fmt::format("{}.{}", name_, i + 1)}] {
            work(io_context, logger, thread_name);
          });
    }
    SL_DEBUG(logger_, "Pool '{}' started with {} threads", name_, thread_count);
  }

  ThreadPool::~ThreadPool() {
    dispose();
  }

  void ThreadPool::execute(Job &&job) {
    // Posting under the lock, so no job is queued after the guard is released
    std::lock_guard lock(mutex_);
    if (disposed_) {
      SL_WARN(logger_, "Pool '{}' is disposed; job is dropped", name_);
      return;
    }
    boost::asio::post(*io_context_, std::move(job));
  }

  void ThreadPool::dispose() {
    {
      std::lock_guard lock(mutex_);
      if (disposed_) {
        return;
      }
      disposed_ = true;
      work_guard_.reset();
    }
    // A running job keeps the other workers in run(), so joining them from
    // a job would never return. They finish the queue by themselves.
    const bool from_own_job = isInPool();
    for (auto &worker : workers_) {
      if (not worker.joinable()) {
        continue;
      }
      if (from_own_job) {
        worker.detach();
      } else {
        worker.join();
      }
    }
    SL_DEBUG(logger_, "Pool '{}' is disposed", name_);
  }

  bool ThreadPool::isInPool() const {
    return io_context_->get_executor().running_in_this_thread();
  }

  void ThreadPool::work(const std::shared_ptr<IoContext> &io_context,
                        const qtils::SharedRef<soralog::Logger> &logger,
                        const std::string &thread_name) {
    soralog::util::setThreadName(thread_name);
    for (;;) {
      try {
        io_context->run();
        break;
      } catch (const std::exception &e) {
        SL_ERROR(logger, "Unhandled exception in pool job: {}", e.what());
      }
    }
  }

}  // namespace chime::executor
