/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include <qtils/outcome.hpp>

#include <peerscout/basic/cancel.hpp>
#include <peerscout/common/types.hpp>
#include <peerscout/peer/peer_info.hpp>
#include <peerscout/routing/peer_stream.hpp>

namespace peerscout::routing {

  struct QueryOptions {
    /// Bounds the whole operation, no limit if not set
    std::optional<std::chrono::milliseconds> timeout;
  };

  /**
   * Peer discovery mechanism, a backend of the composite router
   */
  class PeerRouting {
   public:
    /// Empty optional means the peer is unknown to the backend
    using FindPeerResult = outcome::result<std::optional<peer::PeerInfo>>;
    using FindPeerHandler = std::function<void(FindPeerResult)>;

    virtual ~PeerRouting() = default;

    /**
     * Looks for addresses of the peer
     * @param handler may be called before return
     * @return handle, its destruction asks the backend to abandon the call
     * and not to call the handler; empty if the call can not be cancelled
     */
    [[nodiscard]] virtual Cancel findPeer(const peer::PeerId &peer_id,
                                          FindPeerHandler handler) = 0;

    /**
     * Looks for peers closest to the key, according to backend's metric.
     * Nothing is done until the first pull
     */
    virtual std::shared_ptr<PeerStream> getClosestPeers(
        Bytes key, const QueryOptions &options) = 0;
  };

}  // namespace peerscout::routing
