/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <functional>
#include <span>
#include <unordered_set>
#include <vector>

#include <boost/signals2.hpp>
#include <qtils/outcome.hpp>

#include <peerscout/multi/multiaddress.hpp>
#include <peerscout/peer/peer_id.hpp>

namespace peerscout::peer {

  namespace ttl {

    /// permanent addresses, for example, bootstrap nodes
    constexpr const auto kPermanent = std::chrono::milliseconds::max();

    /// addresses learnt from the routing table refresh
    constexpr const auto kDay = std::chrono::hours(24);

  }  // namespace ttl

  /**
   * @brief Address Repository is a storage of multiaddresses for observed
   * peers.
   */
  class AddressRepository {
   protected:
    using Milliseconds = std::chrono::milliseconds;

   public:
    using AddressCallback = void(const PeerId &, const multi::Multiaddress &);

    virtual ~AddressRepository() = default;

    /**
     * @brief Add addresses to a given peer {@param p}
     * @param p peer
     * @param ma set of multiaddresses, order is kept
     * @param ttl time to live for inserted multiaddresses
     * @return true/false if address was added or not
     *
     * @note triggers #onAddressAdded for each new address
     */
    virtual outcome::result<bool> addAddresses(
        const PeerId &p,
        std::span<const multi::Multiaddress> ma,
        Milliseconds ttl) = 0;

    /**
     * @brief Update existing addresses with new {@param ttl} or insert new
     * addresses with new {@param ttl}
     * @return true/false if at least one new address was added or not
     *
     * @note triggers #onAddressAdded when any new addresses are inserted
     */
    virtual outcome::result<bool> upsertAddresses(
        const PeerId &p,
        std::span<const multi::Multiaddress> ma,
        Milliseconds ttl) = 0;

    /**
     * @brief Update all addresses of a given peer {@param p}
     * @return error when no peer has been found
     */
    virtual outcome::result<void> updateAddresses(const PeerId &p,
                                                  Milliseconds ttl) = 0;

    /**
     * @brief Get all addresses associated with this Peer {@param p}, in
     * insertion order
     * @return array of addresses, or error when no peer {@param p} has been
     * found
     */
    virtual outcome::result<std::vector<multi::Multiaddress>> getAddresses(
        const PeerId &p) const = 0;

    /**
     * @brief Clear all addresses of given Peer {@param p}. Does not evict peer
     * from the list of known peers up to the next garbage collection.
     *
     * @note triggers #onAddressRemoved for every removed address
     */
    virtual void clear(const PeerId &p) = 0;

    /**
     * @brief Returns set of peer ids known by this repository.
     */
    virtual std::unordered_set<PeerId> getPeers() const = 0;

    /// Removes expired addresses and peers without addresses
    virtual void collectGarbage() = 0;

    /**
     * @brief Attach slot to a signal 'onAddressAdded'. Is triggered whenever
     * any peer adds new address.
     * @return connection for that slot (can be used for unsubscribing)
     */
    boost::signals2::connection onAddressAdded(
        const std::function<AddressCallback> &cb);

    /**
     * @brief Attach slot to a signal 'onAddressRemoved'. Is triggered whenever
     * any peer removes address - happens when address is removed manually or
     * automatically via garbage collection mechanism.
     */
    boost::signals2::connection onAddressRemoved(
        const std::function<AddressCallback> &cb);

   protected:
    // NOLINTNEXTLINE(cppcoreguidelines-non-private-member-variables-in-classes)
    boost::signals2::signal<AddressCallback> signal_added_;
    // NOLINTNEXTLINE(cppcoreguidelines-non-private-member-variables-in-classes)
    boost::signals2::signal<AddressCallback> signal_removed_;
  };

}  // namespace peerscout::peer
