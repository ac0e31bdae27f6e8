/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <vector>

#include <peerscout/log/logger.hpp>
#include <peerscout/peer/address_repository.hpp>
#include <peerscout/routing/config.hpp>
#include <peerscout/routing/peer_routing.hpp>

namespace peerscout::local {

  /**
   * Routing table backed by the address repository: knows every peer the node
   * has addresses of, measures closeness by XOR distance of SHA-256 hashes
   */
  class LocalPeerRouting
      : public routing::PeerRouting,
        public std::enable_shared_from_this<LocalPeerRouting> {
   public:
    LocalPeerRouting(const routing::Config &config,
                     std::shared_ptr<peer::AddressRepository> address_repo,
                     peer::PeerId self_id);

    /// Answers synchronously, the call can not be cancelled
    Cancel findPeer(const peer::PeerId &peer_id,
                    FindPeerHandler handler) override;

    std::shared_ptr<routing::PeerStream> getClosestPeers(
        Bytes key, const routing::QueryOptions &options) override;

    /// Adds addresses of the peer to the table
    outcome::result<bool> addPeer(
        const peer::PeerInfo &peer_info,
        std::chrono::milliseconds ttl = peer::ttl::kPermanent);

   private:
    /// @return peers closest to @param key, self excluded
    outcome::result<std::vector<peer::PeerInfo>> closestPeers(
        BytesIn key) const;

    const size_t closest_peers_count_;
    std::shared_ptr<peer::AddressRepository> address_repo_;
    const peer::PeerId self_id_;

    log::Logger log_ = log::createLogger("LocalPeerRouting", "local");
  };

}  // namespace peerscout::local
