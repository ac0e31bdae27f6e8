/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/basic/scheduler/scheduler_impl.hpp>

#include <stdexcept>

namespace peerscout::basic {

  SchedulerImpl::SchedulerImpl(std::shared_ptr<SchedulerBackend> backend,
                               Scheduler::Config config)
      : backend_{std::move(backend)}, config_{config} {}

  Scheduler::Time SchedulerImpl::now() const {
    return backend_->now();
  }

  Scheduler::Handle SchedulerImpl::scheduleImpl(Callback &&cb,
                                                Time delay_from_now,
                                                bool make_handle) {
    if (not cb) {
      throw std::logic_error{"SchedulerImpl::scheduleImpl empty cb arg"};
    }

    // zero key means "deferred", it is always due
    auto abs = Time::zero();
    if (Time::zero() < delay_from_now) {
      abs = backend_->now() + delay_from_now;
    }

    if (not make_handle) {
      backend_->post(
          [weak_self{weak_from_this()}, abs, cb{std::move(cb)}]() mutable {
            if (auto self = weak_self.lock()) {
              self->enqueue(abs, std::move(cb));
            }
          });
      return Handle{};
    }

    auto cancellable = std::make_shared<Cancellable>(std::move(cb));
    std::weak_ptr<Cancellable> weak_cancellable = cancellable;
    backend_->post([weak_self{weak_from_this()},
                    abs,
                    cancellable{std::move(cancellable)}]() mutable {
      auto self = weak_self.lock();
      if (not self or cancellable->cancelled.test()) {
        return;
      }
      self->enqueue(abs, std::move(cancellable));
    });

    return cancelFn([weak_self{weak_from_this()},
                     weak_cancellable{std::move(weak_cancellable)}] {
      auto cancellable = weak_cancellable.lock();
      if (not cancellable or cancellable->cancelled.test_and_set()) {
        return;
      }
      auto self = weak_self.lock();
      if (not self) {
        return;
      }
      // queue is touched from the event loop only
      self->backend_->post([weak_self, weak_cancellable] {
        auto self = weak_self.lock();
        auto cancellable = weak_cancellable.lock();
        if (self and cancellable and cancellable->it) {
          self->queue_.erase(*cancellable->it);
        }
      });
    });
  }

  void SchedulerImpl::enqueue(Time abs, Entry entry) {
    auto it = queue_.emplace(abs, std::move(entry));
    if (auto cancellable = std::get_if<CancellablePtr>(&it->second)) {
      (*cancellable)->it = it;
    }
    pulse();
  }

  void SchedulerImpl::pulse() {
    callReady(Time::zero());
    while (not queue_.empty()) {
      auto now = backend_->now();
      if (callReady(now) != 0) {
        continue;
      }
      auto nearest = queue_.begin()->first;
      if (now < timer_ and timer_ <= nearest + config_.max_timer_threshold) {
        // armed timer is good enough
        return;
      }
      timer_ = std::max(now + config_.max_timer_threshold, nearest);
      backend_->setTimer(timer_, weak_from_this());
      return;
    }
  }

  size_t SchedulerImpl::callReady(Time now) {
    size_t called = 0;
    while (not queue_.empty() and queue_.begin()->first <= now) {
      auto node = queue_.extract(queue_.begin());
      ++called;
      if (auto cb = std::get_if<Callback>(&node.mapped())) {
        (*cb)();
        continue;
      }
      auto &cancellable = std::get<CancellablePtr>(node.mapped());
      cancellable->it.reset();
      if (cancellable->cancelled.test_and_set()) {
        continue;
      }
      cancellable->cb();
    }
    return called;
  }

}  // namespace peerscout::basic
