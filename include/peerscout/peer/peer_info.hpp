/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <peerscout/multi/multiaddress.hpp>
#include <peerscout/peer/peer_id.hpp>

namespace peerscout::peer {

  struct PeerInfo {
    PeerId id;
    std::vector<multi::Multiaddress> addresses;

    bool operator==(const PeerInfo &other) const {
      return id == other.id && addresses == other.addresses;
    }
    bool operator!=(const PeerInfo &other) const {
      return !(*this == other);
    }

    struct EqualByPeerId {
      bool operator()(const PeerInfo &lhs, const PeerInfo &rhs) const noexcept {
        return lhs.id == rhs.id;
      }
    };
  };

}  // namespace peerscout::peer

namespace std {
  template <>
  struct hash<peerscout::peer::PeerInfo> {
    size_t operator()(const peerscout::peer::PeerInfo &peer_info) const {
      return std::hash<peerscout::peer::PeerId>()(peer_info.id);
    }
  };
}  // namespace std
