/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <peerscout/basic/scheduler/backend.hpp>

namespace peerscout::basic {

  /**
   * Scheduler backend on Boost.Asio steady timer
   */
  class AsioSchedulerBackend : public SchedulerBackend {
   public:
    explicit AsioSchedulerBackend(
        std::shared_ptr<boost::asio::io_context> io_context);

    void post(std::function<void()> &&cb) override;

    std::chrono::milliseconds now() const override;

    void setTimer(std::chrono::milliseconds abs_time,
                  std::weak_ptr<SchedulerBackendFeedback> scheduler) override;

   private:
    static std::chrono::milliseconds nowImpl();

    std::shared_ptr<boost::asio::io_context> io_context_;
    boost::asio::steady_timer timer_;
  };

}  // namespace peerscout::basic
