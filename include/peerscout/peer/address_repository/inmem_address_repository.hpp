/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <peerscout/peer/address_repository.hpp>

#include <mutex>
#include <unordered_map>
#include <vector>

namespace peerscout::peer {

  using Clock = std::chrono::steady_clock;

  /**
   * In-memory address store, safe to use from any thread.
   * Signals are emitted outside of the lock
   */
  class InmemAddressRepository : public AddressRepository {
   public:
    outcome::result<bool> addAddresses(const PeerId &p,
                                       std::span<const multi::Multiaddress> ma,
                                       Milliseconds ttl) override;

    outcome::result<bool> upsertAddresses(
        const PeerId &p,
        std::span<const multi::Multiaddress> ma,
        Milliseconds ttl) override;

    outcome::result<void> updateAddresses(const PeerId &p,
                                          Milliseconds ttl) override;

    outcome::result<std::vector<multi::Multiaddress>> getAddresses(
        const PeerId &p) const override;

    void collectGarbage() override;

    void clear(const PeerId &p) override;

    std::unordered_set<PeerId> getPeers() const override;

   private:
    struct Peer {
      std::unordered_map<multi::Multiaddress, Clock::time_point> expires;
      std::vector<multi::Multiaddress> order;

      bool eraseOrder(const multi::Multiaddress &addr);
    };
    using peer_db = std::unordered_map<PeerId, Peer>;
    using Events = std::vector<std::pair<PeerId, multi::Multiaddress>>;

    static Clock::time_point calculateExpirationTime(Milliseconds ttl);

    /// Inserts new addresses, refreshes known ones if @param refresh
    Events insert(const PeerId &p,
                  std::span<const multi::Multiaddress> ma,
                  Milliseconds ttl,
                  bool refresh);

    mutable std::mutex mutex_;
    peer_db db_;
  };

}  // namespace peerscout::peer
