/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/local/local_peer_routing.hpp>

#include <algorithm>

#include <boost/assert.hpp>

#include <peerscout/local/node_id.hpp>
#include <peerscout/routing/error.hpp>
#include <peerscout/routing/peer_channel.hpp>

namespace peerscout::local {

  LocalPeerRouting::LocalPeerRouting(
      const routing::Config &config,
      std::shared_ptr<peer::AddressRepository> address_repo,
      peer::PeerId self_id)
      : closest_peers_count_(config.closestPeersCount),
        address_repo_(std::move(address_repo)),
        self_id_(std::move(self_id)) {
    BOOST_ASSERT(address_repo_ != nullptr);
  }

  Cancel LocalPeerRouting::findPeer(const peer::PeerId &peer_id,
                                    FindPeerHandler handler) {
    auto addresses = address_repo_->getAddresses(peer_id);
    if (addresses.has_error() or addresses.value().empty()) {
      SL_TRACE(log_, "peer {} is unknown", peer_id);
      handler(std::nullopt);
      return {};
    }
    handler(peer::PeerInfo{peer_id, std::move(addresses.value())});
    return {};
  }

  std::shared_ptr<routing::PeerStream> LocalPeerRouting::getClosestPeers(
      Bytes key, const routing::QueryOptions &) {
    auto channel = std::make_shared<routing::PeerChannel>();
    channel->onDemand([weak_self{weak_from_this()},
                       weak_channel{std::weak_ptr{channel}},
                       key{std::move(key)}] {
      auto self = weak_self.lock();
      auto channel = weak_channel.lock();
      if (not channel) {
        return;
      }
      channel->onDemand(nullptr);
      if (not self) {
        channel->close(routing::RoutingError::CANCELLED);
        return;
      }
      // whole answer is computed at the first demand
      auto peers = self->closestPeers(key);
      if (peers.has_error()) {
        self->log_->warn("closest peers query failed: {}",
                         peers.error().message());
        channel->close(peers.error());
        return;
      }
      SL_DEBUG(self->log_, "{} closest peers found", peers.value().size());
      for (auto &peer_info : peers.value()) {
        channel->push(std::move(peer_info));
      }
      channel->close();
    });
    return channel;
  }

  outcome::result<bool> LocalPeerRouting::addPeer(
      const peer::PeerInfo &peer_info, std::chrono::milliseconds ttl) {
    return address_repo_->upsertAddresses(
        peer_info.id, peer_info.addresses, ttl);
  }

  outcome::result<std::vector<peer::PeerInfo>> LocalPeerRouting::closestPeers(
      BytesIn key) const {
    OUTCOME_TRY(target, NodeId::hashOf(key));

    std::vector<std::pair<NodeId, peer::PeerId>> candidates;
    for (auto &peer_id : address_repo_->getPeers()) {
      if (peer_id == self_id_) {
        continue;
      }
      OUTCOME_TRY(node_id, NodeId::hashOf(peer_id));
      candidates.emplace_back(node_id, peer_id);
    }

    XorDistanceComparator closer{target};
    std::ranges::sort(candidates, [&](const auto &a, const auto &b) {
      return closer(a.first, b.first);
    });

    std::vector<peer::PeerInfo> peers;
    for (auto &[node_id, peer_id] : candidates) {
      if (peers.size() >= closest_peers_count_) {
        break;
      }
      auto addresses = address_repo_->getAddresses(peer_id);
      if (addresses.has_error() or addresses.value().empty()) {
        continue;
      }
      peers.push_back({peer_id, std::move(addresses.value())});
    }
    return peers;
  }

}  // namespace peerscout::local
