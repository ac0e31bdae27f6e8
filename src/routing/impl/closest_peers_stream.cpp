/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/routing/impl/closest_peers_stream.hpp>

#include <boost/assert.hpp>

#include <peerscout/routing/error.hpp>

namespace peerscout::routing {

  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  std::atomic_size_t ClosestPeersStream::instance_number = 0;

  ClosestPeersStream::ClosestPeersStream(
      std::vector<std::shared_ptr<PeerRouting>> backends,
      std::shared_ptr<basic::Scheduler> scheduler,
      Bytes key,
      QueryOptions options)
      : backends_(std::move(backends)),
        scheduler_(std::move(scheduler)),
        key_(std::move(key)),
        options_(options),
        log_("CompositeRouter",
             "routing",
             "ClosestPeers",
             ++instance_number) {
    BOOST_ASSERT(scheduler_ != nullptr);
  }

  ClosestPeersStream::~ClosestPeersStream() {
    if (current_) {
      current_->cancel();
    }
  }

  void ClosestPeersStream::next(NextHandler handler) {
    if (terminal_) {
      handler(*terminal_);
      return;
    }
    if (pending_) {
      handler(RoutingError::IN_PROGRESS);
      return;
    }
    pending_ = std::move(handler);

    if (not started_) {
      started_ = true;
      if (backends_.empty()) {
        log_.debug("no backends");
        finish(RoutingError::NO_ROUTERS_AVAILABLE);
        return;
      }
      if (options_.timeout) {
        timeout_handle_ = scheduler_->scheduleWithHandle(
            [weak_self{weak_from_this()}] {
              if (auto self = weak_self.lock()) {
                self->onTimeout();
              }
            },
            *options_.timeout);
      }
      log_.debug("started");
      open();
      return;
    }

    pull();
  }

  void ClosestPeersStream::cancel() {
    if (terminal_) {
      return;
    }
    log_.debug("cancelled");
    terminal_ = RoutingError::CANCELLED;
    pending_ = nullptr;
    timeout_handle_.reset();
    if (auto current = std::move(current_)) {
      current->cancel();
    }
  }

  void ClosestPeersStream::open() {
    log_.debug("asking backend #{}", index_);
    ++generation_;
    produced_ = false;
    current_ = backends_[index_]->getClosestPeers(key_, {});
    pull();
  }

  void ClosestPeersStream::pull() {
    current_->next(
        [weak_self{weak_from_this()}, generation{generation_}](
            NextResult result) {
          if (auto self = weak_self.lock()) {
            self->onNext(generation, std::move(result));
          }
        });
  }

  void ClosestPeersStream::onNext(size_t generation, NextResult result) {
    if (terminal_ or generation != generation_) {
      return;
    }

    if (result.has_error()) {
      if (produced_) {
        log_.debug("backend #{} failed mid-stream: {}",
                   index_,
                   result.error().message());
        finish(result.error());
        return;
      }
      log_.debug("backend #{} failed: {}", index_, result.error().message());
      last_error_ = result.error();
      fallback();
      return;
    }

    if (not result.value().has_value()) {
      if (produced_) {
        finish(std::nullopt);
        return;
      }
      log_.debug("backend #{} has nothing", index_);
      last_error_.reset();
      fallback();
      return;
    }

    produced_ = true;
    deliver(std::move(result));
  }

  void ClosestPeersStream::fallback() {
    current_.reset();
    if (++index_ < backends_.size()) {
      open();
      return;
    }
    if (last_error_) {
      finish(*last_error_);
    } else {
      finish(std::nullopt);
    }
  }

  void ClosestPeersStream::onTimeout() {
    if (terminal_) {
      return;
    }
    log_.debug("timed out, cancelling backend #{}", index_);
    auto current = std::move(current_);
    finish(RoutingError::TIMEOUT);
    // cancelled backend may still answer, it is ignored after finish
    if (current) {
      current->cancel();
    }
  }

  void ClosestPeersStream::finish(NextResult result) {
    if (result.has_value()) {
      log_.debug("done");
    } else {
      log_.debug("done: {}", result.error().message());
    }
    terminal_ = result;
    timeout_handle_.reset();
    current_.reset();
    deliver(std::move(result));
  }

  void ClosestPeersStream::deliver(NextResult result) {
    if (not pending_) {
      return;
    }
    auto handler = std::move(pending_);
    pending_ = nullptr;
    handler(std::move(result));
  }

}  // namespace peerscout::routing
