/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>

#include <peerscout/basic/cancel.hpp>

namespace peerscout::basic {

  /**
   * Deferred and delayed execution of callbacks on the event loop, low-res
   * timers
   */
  class Scheduler {
   public:
    struct Config {
      static constexpr std::chrono::milliseconds kMaxTimerThreshold{10};

      /// Timers closer than this are fired together, avoids frequent timer
      /// switches
      std::chrono::milliseconds max_timer_threshold = kMaxTimerThreshold;
    };

    using Handle = Cancel;
    using Callback = std::function<void()>;
    using Time = std::chrono::milliseconds;

    virtual ~Scheduler() = default;

    /// Defers callback to the next event loop cycle
    void schedule(Callback &&cb) {
      std::ignore = scheduleImpl(std::move(cb), Time::zero(), false);
    }

    /// Calls callback after @param delay_from_now
    void schedule(Callback &&cb, Time delay_from_now) {
      std::ignore = scheduleImpl(std::move(cb), delay_from_now, false);
    }

    /**
     * Defers callback to the next event loop cycle
     * @return handle, callback is not called once the handle is destroyed
     */
    [[nodiscard]] Handle scheduleWithHandle(Callback &&cb) {
      return scheduleImpl(std::move(cb), Time::zero(), true);
    }

    /**
     * Calls callback after @param delay_from_now
     * @return handle, callback is not called once the handle is destroyed
     */
    [[nodiscard]] Handle scheduleWithHandle(Callback &&cb,
                                            Time delay_from_now) {
      return scheduleImpl(std::move(cb), delay_from_now, true);
    }

    /// @return milliseconds since clock's epoch
    virtual Time now() const = 0;

    /// Lvalue callbacks are not accepted
    Handle scheduleImpl(Callback &cb, Time, bool) = delete;

   protected:
    /**
     * @param cb callback
     * @param delay_from_now zero for deferred call
     * @param make_handle if false, empty handle is returned
     */
    virtual Handle scheduleImpl(Callback &&cb,
                                Time delay_from_now,
                                bool make_handle) = 0;
  };

}  // namespace peerscout::basic
