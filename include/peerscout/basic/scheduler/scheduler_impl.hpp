/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <map>
#include <optional>
#include <variant>

#include <peerscout/basic/scheduler.hpp>
#include <peerscout/basic/scheduler/backend.hpp>

namespace peerscout::basic {

  class SchedulerImpl : public std::enable_shared_from_this<SchedulerImpl>,
                        public Scheduler,
                        public SchedulerBackendFeedback {
   public:
    SchedulerImpl(std::shared_ptr<SchedulerBackend> backend,
                  Scheduler::Config config);

    Time now() const override;

    void pulse() override;

   protected:
    Handle scheduleImpl(Callback &&cb,
                        Time delay_from_now,
                        bool make_handle) override;

   private:
    struct Cancellable;
    using CancellablePtr = std::shared_ptr<Cancellable>;
    using Entry = std::variant<CancellablePtr, Callback>;
    using Queue = std::multimap<Time, Entry>;

    struct Cancellable {
      explicit Cancellable(Callback &&cb) : cb{std::move(cb)} {}

      std::atomic_flag cancelled = ATOMIC_FLAG_INIT;
      std::optional<Queue::iterator> it;
      Callback cb;
    };

    /// Calls callbacks which are due at @param now, @returns their number
    size_t callReady(Time now);

    void enqueue(Time abs, Entry entry);

    std::shared_ptr<SchedulerBackend> backend_;
    const Scheduler::Config config_;
    Queue queue_;
    Time timer_{};
  };

}  // namespace peerscout::basic
