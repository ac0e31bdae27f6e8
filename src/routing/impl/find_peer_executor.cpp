/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/routing/impl/find_peer_executor.hpp>

#include <boost/assert.hpp>

#include <peerscout/routing/error.hpp>

namespace peerscout::routing {

  // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
  std::atomic_size_t FindPeerExecutor::instance_number = 0;

  FindPeerExecutor::FindPeerExecutor(
      std::vector<std::shared_ptr<PeerRouting>> backends,
      std::shared_ptr<basic::Scheduler> scheduler,
      peer::PeerId peer_id,
      FindPeerOptions options,
      Router::FoundPeerInfoHandler handler)
      : backends_(std::move(backends)),
        scheduler_(std::move(scheduler)),
        sought_peer_id_(std::move(peer_id)),
        options_(options),
        handler_(std::move(handler)),
        log_("CompositeRouter", "routing", "FindPeer", ++instance_number) {
    BOOST_ASSERT(scheduler_ != nullptr);
    BOOST_ASSERT(handler_);
    log_.debug("created for {}", sought_peer_id_);
  }

  FindPeerExecutor::~FindPeerExecutor() {
    log_.debug("destroyed");
  }

  outcome::result<void> FindPeerExecutor::start() {
    if (started_ or done_) {
      return RoutingError::IN_PROGRESS;
    }
    started_ = true;

    log_.debug("started");

    if (options_.timeout) {
      timeout_handle_ = scheduler_->scheduleWithHandle(
          [self{shared_from_this()}] {
            if (self->done_) {
              return;
            }
            self->log_.debug("timed out, cancelling backend #{}", self->index_);
            // done() marks the lookup finished before cancelling the backend
            self->done(RoutingError::TIMEOUT);
          },
          *options_.timeout);
    }

    spawn();

    return outcome::success();
  }

  void FindPeerExecutor::done(outcome::result<peer::PeerInfo> result) {
    bool x = false;
    if (not done_.compare_exchange_strong(x, true)) {
      return;
    }
    if (result.has_value()) {
      log_.debug("done: peer is found with {} addresses",
                 result.value().addresses.size());
    } else {
      log_.debug("done: {}", result.error().message());
    }
    auto handler = std::move(handler_);
    timeout_handle_.reset();
    active_.reset();
    handler(std::move(result));
  }

  void FindPeerExecutor::spawn() {
    if (done_) {
      return;
    }
    if (index_ >= backends_.size()) {
      if (last_error_) {
        done(*last_error_);
      } else {
        done(RoutingError::NOT_FOUND);
      }
      return;
    }

    auto attempt = ++attempt_;
    log_.debug("asking backend #{}", index_);

    auto cancel = backends_[index_]->findPeer(
        sought_peer_id_,
        [self{shared_from_this()}, attempt](PeerRouting::FindPeerResult res) {
          self->onResult(attempt, std::move(res));
        });

    // answered synchronously, the handle belongs to a finished call
    if (done_ or attempt != attempt_) {
      return;
    }
    active_ = std::move(cancel);
  }

  void FindPeerExecutor::onResult(size_t attempt,
                                  PeerRouting::FindPeerResult result) {
    if (done_ or attempt != attempt_) {
      return;
    }
    auto finished = std::move(active_);

    if (result.has_value()) {
      if (result.value().has_value()) {
        done(std::move(*result.value()));
        return;
      }
      log_.debug("backend #{} does not know the peer", index_);
      last_error_.reset();
    } else {
      log_.debug("backend #{} failed: {}", index_, result.error().message());
      last_error_ = result.error();
    }

    ++index_;
    spawn();
  }

}  // namespace peerscout::routing
