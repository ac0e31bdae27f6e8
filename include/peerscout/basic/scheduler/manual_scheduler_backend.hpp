/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>
#include <optional>

#include <peerscout/basic/scheduler/backend.hpp>

namespace peerscout::basic {

  /**
   * Scheduler backend with manually driven clock, for tests
   */
  class ManualSchedulerBackend : public SchedulerBackend {
   public:
    ManualSchedulerBackend() : current_clock_(1) {}

    void post(std::function<void()> &&cb) override;

    std::chrono::milliseconds now() const override {
      return current_clock_;
    }

    void setTimer(std::chrono::milliseconds abs_time,
                  std::weak_ptr<SchedulerBackendFeedback> scheduler) override;

    /**
     * Moves clock forward by @param delta, calls everything deferred or
     * expired in between
     */
    void shift(std::chrono::milliseconds delta);

    /// Moves clock to the nearest timer expiry
    void shiftToTimer();

    /// @return true if nothing is deferred and the timer is not armed
    bool empty() const {
      return deferred_.empty() and not timer_expires_;
    }

   private:
    void callDeferred();

    std::chrono::milliseconds current_clock_;
    std::deque<std::function<void()>> deferred_;
    std::weak_ptr<SchedulerBackendFeedback> scheduler_;
    std::optional<std::chrono::milliseconds> timer_expires_;
  };

}  // namespace peerscout::basic
