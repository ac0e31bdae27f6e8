/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/routing/refresh_manager.hpp>

#include <boost/assert.hpp>

namespace peerscout::routing {

  RefreshManager::RefreshManager(
      const Config &config,
      std::shared_ptr<basic::Scheduler> scheduler,
      std::shared_ptr<PeerRouting> routing_table,
      std::shared_ptr<peer::AddressRepository> address_repo,
      peer::PeerId self_id)
      : config_(config.refreshManager),
        scheduler_(std::move(scheduler)),
        routing_table_(std::move(routing_table)),
        address_repo_(std::move(address_repo)),
        self_id_(std::move(self_id)) {
    BOOST_ASSERT(scheduler_ != nullptr);
    BOOST_ASSERT(routing_table_ != nullptr);
    BOOST_ASSERT(address_repo_ != nullptr);
  }

  RefreshManager::~RefreshManager() {
    timer_.reset();
    if (query_) {
      query_->cancel();
    }
  }

  void RefreshManager::start() {
    if (state_ != State::IDLE) {
      log_->warn("start() ignored, already started");
      return;
    }
    if (not config_.enabled) {
      log_->info("routing table refresh is disabled");
      state_ = State::STOPPED;
      return;
    }
    log_->info("first refresh in {} ms", config_.bootDelay.count());
    state_ = State::SCHEDULED;
    arm(config_.bootDelay);
  }

  void RefreshManager::stop() {
    if (state_ == State::STOPPED) {
      return;
    }
    log_->info("stopped");
    state_ = State::STOPPED;
    timer_.reset();
    if (auto query = std::move(query_)) {
      query->cancel();
    }
  }

  void RefreshManager::arm(std::chrono::milliseconds delay) {
    timer_ = scheduler_->scheduleWithHandle(
        [weak_self{weak_from_this()}] {
          if (auto self = weak_self.lock()) {
            self->onTimer();
          }
        },
        delay);
  }

  void RefreshManager::onTimer() {
    if (state_ != State::SCHEDULED and state_ != State::WAITING) {
      return;
    }
    run();
  }

  void RefreshManager::run() {
    state_ = State::RUNNING;
    ++cycle_;
    learnt_ = 0;
    log_->debug("refresh #{} started", cycle_);
    query_ = routing_table_->getClosestPeers(self_id_.toVector(), {});
    pull(cycle_);
  }

  void RefreshManager::pull(size_t cycle) {
    query_->next([weak_self{weak_from_this()},
                  cycle](PeerStream::NextResult result) {
      if (auto self = weak_self.lock()) {
        self->onNext(cycle, std::move(result));
      }
    });
  }

  void RefreshManager::onNext(size_t cycle, PeerStream::NextResult result) {
    if (state_ != State::RUNNING or cycle != cycle_) {
      return;
    }

    if (result.has_error()) {
      log_->warn("refresh #{} failed: {}", cycle, result.error().message());
      finishCycle();
      return;
    }
    if (not result.value().has_value()) {
      log_->debug("refresh #{} done, {} peers learnt", cycle, learnt_);
      finishCycle();
      return;
    }

    const auto &peer_info = *result.value();
    auto added = address_repo_->upsertAddresses(
        peer_info.id, peer_info.addresses, config_.addressTtl);
    if (added.has_error()) {
      log_->warn("can not store addresses of {}: {}",
                 peer_info.id,
                 added.error().message());
    } else {
      ++learnt_;
    }

    pull(cycle);
  }

  void RefreshManager::finishCycle() {
    state_ = State::WAITING;
    log_->debug("next refresh in {} ms", config_.interval.count());
    arm(config_.interval);
  }

}  // namespace peerscout::routing
