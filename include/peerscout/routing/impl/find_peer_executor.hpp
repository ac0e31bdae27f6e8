/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>
#include <system_error>
#include <vector>

#include <peerscout/basic/scheduler.hpp>
#include <peerscout/log/sublogger.hpp>
#include <peerscout/routing/router.hpp>

namespace peerscout::routing {

  /**
   * Single findPeer call of the composite router: asks backends one by one
   * until one of them knows the peer
   */
  class FindPeerExecutor
      : public std::enable_shared_from_this<FindPeerExecutor> {
   public:
    FindPeerExecutor(std::vector<std::shared_ptr<PeerRouting>> backends,
                     std::shared_ptr<basic::Scheduler> scheduler,
                     peer::PeerId peer_id,
                     FindPeerOptions options,
                     Router::FoundPeerInfoHandler handler);

    ~FindPeerExecutor();

    outcome::result<void> start();

    void done(outcome::result<peer::PeerInfo> result);

   private:
    /// Asks the next backend
    void spawn();

    void onResult(size_t attempt, PeerRouting::FindPeerResult result);

    static std::atomic_size_t instance_number;

    // Primary
    const std::vector<std::shared_ptr<PeerRouting>> backends_;
    std::shared_ptr<basic::Scheduler> scheduler_;

    // Secondary
    const peer::PeerId sought_peer_id_;
    const FindPeerOptions options_;
    Router::FoundPeerInfoHandler handler_;

    // Auxiliary
    size_t index_ = 0;
    size_t attempt_ = 0;
    std::optional<std::error_code> last_error_;
    Cancel active_;
    basic::Scheduler::Handle timeout_handle_;
    bool started_ = false;
    std::atomic_bool done_ = false;

    log::SubLogger log_;
  };

}  // namespace peerscout::routing
