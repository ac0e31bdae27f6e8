/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/basic/scheduler/asio_scheduler_backend.hpp>

#include <boost/asio/post.hpp>

#include <peerscout/log/logger.hpp>

namespace peerscout::basic {

  AsioSchedulerBackend::AsioSchedulerBackend(
      std::shared_ptr<boost::asio::io_context> io_context)
      : io_context_(std::move(io_context)), timer_(*io_context_) {}

  void AsioSchedulerBackend::post(std::function<void()> &&cb) {
    boost::asio::post(*io_context_, std::move(cb));
  }

  std::chrono::milliseconds AsioSchedulerBackend::now() const {
    return nowImpl();
  }

  void AsioSchedulerBackend::setTimer(
      std::chrono::milliseconds abs_time,
      std::weak_ptr<SchedulerBackendFeedback> scheduler) {
    boost::system::error_code ec;
    timer_.expires_at(decltype(timer_)::clock_type::time_point(abs_time), ec);
    if (ec) {
      auto log = log::createLogger("Scheduler", "scheduler");
      log->critical("cannot set timer: {}", ec.message());
      boost::asio::detail::throw_error(ec, "setTimer");
    }

    timer_.async_wait([scheduler = std::move(scheduler)](
                          const boost::system::error_code &error) {
      if (error) {
        // re-armed or destroyed
        return;
      }
      if (auto sch = scheduler.lock()) {
        sch->pulse();
      }
    });
  }

  std::chrono::milliseconds AsioSchedulerBackend::nowImpl() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        decltype(timer_)::clock_type::now().time_since_epoch());
  }

}  // namespace peerscout::basic
