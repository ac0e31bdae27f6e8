/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <peerscout/basic/scheduler.hpp>
#include <peerscout/log/logger.hpp>
#include <peerscout/peer/address_repository.hpp>
#include <peerscout/routing/config.hpp>
#include <peerscout/routing/peer_routing.hpp>

namespace peerscout::routing {

  /**
   * Periodically looks up peers closest to self in the routing table backend
   * and stores their addresses. Single lifecycle: started once, stopped once
   */
  class RefreshManager : public std::enable_shared_from_this<RefreshManager> {
   public:
    enum class State {
      IDLE,
      SCHEDULED,
      RUNNING,
      WAITING,
      STOPPED,
    };

    RefreshManager(const Config &config,
                   std::shared_ptr<basic::Scheduler> scheduler,
                   std::shared_ptr<PeerRouting> routing_table,
                   std::shared_ptr<peer::AddressRepository> address_repo,
                   peer::PeerId self_id);

    ~RefreshManager();

    /// Arms the first refresh, has effect in IDLE state only
    void start();

    /// Cancels armed timer and the query in flight, may be called in any state
    void stop();

    State state() const {
      return state_;
    }

   private:
    void arm(std::chrono::milliseconds delay);

    void onTimer();

    void run();

    void pull(size_t cycle);

    void onNext(size_t cycle, PeerStream::NextResult result);

    void finishCycle();

    const RefreshManagerConfig config_;
    std::shared_ptr<basic::Scheduler> scheduler_;
    std::shared_ptr<PeerRouting> routing_table_;
    std::shared_ptr<peer::AddressRepository> address_repo_;
    const peer::PeerId self_id_;

    State state_ = State::IDLE;
    size_t cycle_ = 0;
    size_t learnt_ = 0;
    basic::Scheduler::Handle timer_;
    std::shared_ptr<PeerStream> query_;

    log::Logger log_ = log::createLogger("RefreshManager", "refresh");
  };

}  // namespace peerscout::routing
