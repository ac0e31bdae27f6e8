/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>

#include <qtils/outcome.hpp>

#include <peerscout/routing/peer_routing.hpp>

namespace peerscout::routing {

  using FindPeerOptions = QueryOptions;

  /**
   * Single entry point for peer lookups, falls back over the configured
   * backends in priority order
   */
  class Router {
   public:
    using FoundPeerInfoHandler =
        std::function<void(outcome::result<peer::PeerInfo>)>;

    virtual ~Router() = default;

    /**
     * Finds addresses of the peer
     * @param handler is called exactly once if the lookup is started
     * @return error if the lookup can not be started
     */
    virtual outcome::result<void> findPeer(const peer::PeerId &peer_id,
                                           const FindPeerOptions &options,
                                           FoundPeerInfoHandler handler) = 0;

    /**
     * Streams peers closest to the key from the first productive backend
     */
    virtual std::shared_ptr<PeerStream> getClosestPeers(
        Bytes key, const QueryOptions &options) = 0;
  };

}  // namespace peerscout::routing
