/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/routing/impl/composite_router.hpp>

#include <algorithm>

#include <boost/assert.hpp>

#include <peerscout/routing/error.hpp>
#include <peerscout/routing/impl/closest_peers_stream.hpp>
#include <peerscout/routing/impl/find_peer_executor.hpp>

namespace peerscout::routing {

  CompositeRouter::CompositeRouter(
      std::vector<std::shared_ptr<PeerRouting>> backends,
      std::shared_ptr<basic::Scheduler> scheduler)
      : backends_(std::move(backends)), scheduler_(std::move(scheduler)) {
    BOOST_ASSERT(scheduler_ != nullptr);
    BOOST_ASSERT(std::ranges::all_of(
        backends_, [](const auto &backend) { return backend != nullptr; }));
    log_->debug("created with {} backends", backends_.size());
  }

  outcome::result<void> CompositeRouter::findPeer(
      const peer::PeerId &peer_id,
      const FindPeerOptions &options,
      FoundPeerInfoHandler handler) {
    if (backends_.empty()) {
      SL_DEBUG(log_, "findPeer {}: no backends", peer_id);
      return RoutingError::NO_ROUTERS_AVAILABLE;
    }
    auto executor = std::make_shared<FindPeerExecutor>(
        backends_, scheduler_, peer_id, options, std::move(handler));
    return executor->start();
  }

  std::shared_ptr<PeerStream> CompositeRouter::getClosestPeers(
      Bytes key, const QueryOptions &options) {
    return std::make_shared<ClosestPeersStream>(
        backends_, scheduler_, std::move(key), options);
  }

}  // namespace peerscout::routing
