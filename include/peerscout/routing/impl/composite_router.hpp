/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <vector>

#include <peerscout/basic/scheduler.hpp>
#include <peerscout/log/logger.hpp>
#include <peerscout/routing/router.hpp>

namespace peerscout::routing {

  /**
   * Router over an ordered list of backends: first backend has the highest
   * priority. The list is fixed at construction
   */
  class CompositeRouter : public Router {
   public:
    CompositeRouter(std::vector<std::shared_ptr<PeerRouting>> backends,
                    std::shared_ptr<basic::Scheduler> scheduler);

    outcome::result<void> findPeer(const peer::PeerId &peer_id,
                                   const FindPeerOptions &options,
                                   FoundPeerInfoHandler handler) override;

    std::shared_ptr<PeerStream> getClosestPeers(
        Bytes key, const QueryOptions &options) override;

   private:
    const std::vector<std::shared_ptr<PeerRouting>> backends_;
    std::shared_ptr<basic::Scheduler> scheduler_;

    log::Logger log_ = log::createLogger("CompositeRouter", "routing");
  };

}  // namespace peerscout::routing
