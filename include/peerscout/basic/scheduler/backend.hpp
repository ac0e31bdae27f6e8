/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace peerscout::basic {

  /**
   * Backend calls it back when the timer expires
   */
  class SchedulerBackendFeedback {
   public:
    virtual ~SchedulerBackendFeedback() = default;

    /// Fires ready callbacks
    virtual void pulse() = 0;
  };

  /**
   * Source of time and of the single timer used by SchedulerImpl:
   * AsioSchedulerBackend runs on io_context and steady clock,
   * ManualSchedulerBackend is shifted by tests
   */
  class SchedulerBackend {
   public:
    virtual ~SchedulerBackend() = default;

    /// Calls @param cb on the next event loop cycle
    virtual void post(std::function<void()> &&cb) = 0;

    /// @return milliseconds since clock's epoch
    virtual std::chrono::milliseconds now() const = 0;

    /**
     * Arms the timer, previous expiry is forgotten
     * @param abs_time milliseconds since clock's epoch
     * @param scheduler feedback, may expire before the timer
     */
    virtual void setTimer(std::chrono::milliseconds abs_time,
                          std::weak_ptr<SchedulerBackendFeedback> scheduler) = 0;
  };

}  // namespace peerscout::basic
