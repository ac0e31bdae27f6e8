/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <peerscout/delegated/config.hpp>
#include <peerscout/delegated/http_client.hpp>
#include <peerscout/log/logger.hpp>
#include <peerscout/routing/peer_routing.hpp>

namespace peerscout::delegated {

  /**
   * Delegates lookups to a remote node over its HTTP API
   * ("dht/findpeer" and "dht/query" commands)
   */
  class DelegatedPeerRouting : public routing::PeerRouting {
   public:
    DelegatedPeerRouting(const Config &config,
                         std::shared_ptr<HttpClient> http_client);

    /// Destroying returned handle aborts the request
    Cancel findPeer(const peer::PeerId &peer_id,
                    FindPeerHandler handler) override;

    std::shared_ptr<routing::PeerStream> getClosestPeers(
        Bytes key, const routing::QueryOptions &options) override;

   private:
    std::string makeTarget(std::string_view command,
                           std::string_view arg) const;

    const std::string api_path_;
    std::shared_ptr<HttpClient> http_client_;

    log::Logger log_ = log::createLogger("DelegatedPeerRouting", "delegated");
  };

}  // namespace peerscout::delegated
