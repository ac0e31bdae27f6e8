/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/peer/address_repository/inmem_address_repository.hpp>

#include <algorithm>

#include <peerscout/peer/errors.hpp>

namespace peerscout::peer {

  Clock::time_point InmemAddressRepository::calculateExpirationTime(
      Milliseconds ttl) {
    if (ttl >= std::chrono::duration_cast<Milliseconds>(
            Clock::time_point::max() - Clock::now())) {
      return Clock::time_point::max();
    }
    return Clock::now() + ttl;
  }

  InmemAddressRepository::Events InmemAddressRepository::insert(
      const PeerId &p,
      std::span<const multi::Multiaddress> ma,
      Milliseconds ttl,
      bool refresh) {
    Events added;
    auto expires_at = calculateExpirationTime(ttl);

    std::lock_guard lock{mutex_};
    auto &addresses = db_[p];
    for (const auto &m : ma) {
      auto [addr_it, emplaced] = addresses.expires.emplace(m, expires_at);
      if (emplaced) {
        addresses.order.emplace_back(m);
        added.emplace_back(p, m);
      } else if (refresh) {
        addr_it->second = expires_at;
      }
    }
    return added;
  }

  outcome::result<bool> InmemAddressRepository::addAddresses(
      const PeerId &p,
      std::span<const multi::Multiaddress> ma,
      Milliseconds ttl) {
    auto added = insert(p, ma, ttl, false);
    for (const auto &[peer, addr] : added) {
      signal_added_(peer, addr);
    }
    return not added.empty();
  }

  outcome::result<bool> InmemAddressRepository::upsertAddresses(
      const PeerId &p,
      std::span<const multi::Multiaddress> ma,
      Milliseconds ttl) {
    auto added = insert(p, ma, ttl, true);
    for (const auto &[peer, addr] : added) {
      signal_added_(peer, addr);
    }
    return not added.empty();
  }

  outcome::result<void> InmemAddressRepository::updateAddresses(
      const PeerId &p, Milliseconds ttl) {
    auto expires_at = calculateExpirationTime(ttl);

    std::lock_guard lock{mutex_};
    auto peer_it = db_.find(p);
    if (peer_it == db_.end()) {
      return PeerError::NOT_FOUND;
    }
    for (auto &item : peer_it->second.expires) {
      item.second = expires_at;
    }
    return outcome::success();
  }

  outcome::result<std::vector<multi::Multiaddress>>
  InmemAddressRepository::getAddresses(const PeerId &p) const {
    std::lock_guard lock{mutex_};
    auto peer_it = db_.find(p);
    if (peer_it == db_.end()) {
      return PeerError::NOT_FOUND;
    }
    return peer_it->second.order;
  }

  void InmemAddressRepository::clear(const PeerId &p) {
    Events removed;
    {
      std::lock_guard lock{mutex_};
      auto it = db_.find(p);
      if (it == db_.end()) {
        return;
      }
      for (const auto &addr : it->second.order) {
        removed.emplace_back(p, addr);
      }
      it->second = {};
    }
    for (const auto &[peer, addr] : removed) {
      signal_removed_(peer, addr);
    }
  }

  void InmemAddressRepository::collectGarbage() {
    Events removed;
    {
      std::lock_guard lock{mutex_};
      auto now = Clock::now();
      auto peer = db_.begin();
      while (peer != db_.end()) {
        auto &maptr = peer->second;
        auto ma = maptr.expires.begin();
        while (ma != maptr.expires.end()) {
          if (now >= ma->second) {
            removed.emplace_back(peer->first, ma->first);
            maptr.eraseOrder(ma->first);
            // erase returns element next to deleted
            ma = maptr.expires.erase(ma);
          } else {
            ++ma;
          }
        }

        // peer has no more addresses
        if (maptr.expires.empty()) {
          peer = db_.erase(peer);
        } else {
          ++peer;
        }
      }
    }
    for (const auto &[peer, addr] : removed) {
      signal_removed_(peer, addr);
    }
  }

  std::unordered_set<PeerId> InmemAddressRepository::getPeers() const {
    std::lock_guard lock{mutex_};
    std::unordered_set<PeerId> peers;
    for (const auto &it : db_) {
      peers.insert(it.first);
    }
    return peers;
  }

  bool InmemAddressRepository::Peer::eraseOrder(
      const multi::Multiaddress &addr) {
    auto it = std::ranges::find(order, addr);
    if (it == order.end()) {
      return false;
    }
    order.erase(it);
    return true;
  }

}  // namespace peerscout::peer
