/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/basic/scheduler/manual_scheduler_backend.hpp>

#include <algorithm>

namespace peerscout::basic {

  void ManualSchedulerBackend::post(std::function<void()> &&cb) {
    deferred_.emplace_back(std::move(cb));
  }

  void ManualSchedulerBackend::setTimer(
      std::chrono::milliseconds abs_time,
      std::weak_ptr<SchedulerBackendFeedback> scheduler) {
    timer_expires_ = abs_time;
    scheduler_ = std::move(scheduler);
  }

  void ManualSchedulerBackend::shift(std::chrono::milliseconds delta) {
    callDeferred();
    auto target = current_clock_ + std::max(delta, std::chrono::milliseconds{});
    // timers which expire in between fire at their own time, so that
    // callbacks observe the clock they were scheduled for
    while (timer_expires_ and *timer_expires_ <= target) {
      current_clock_ = std::max(current_clock_, *timer_expires_);
      timer_expires_.reset();
      if (auto scheduler = scheduler_.lock()) {
        scheduler->pulse();
      }
      callDeferred();
    }
    current_clock_ = target;
    callDeferred();
  }

  void ManualSchedulerBackend::shiftToTimer() {
    shift(std::max(timer_expires_.value_or(current_clock_), current_clock_)
          - current_clock_);
  }

  void ManualSchedulerBackend::callDeferred() {
    while (not deferred_.empty()) {
      auto cb = std::move(deferred_.front());
      deferred_.pop_front();
      cb();
    }
  }

}  // namespace peerscout::basic
