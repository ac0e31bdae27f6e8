/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstring>

#include <peerscout/crypto/sha256.hpp>
#include <peerscout/peer/peer_id.hpp>

namespace peerscout::local {

  using common::Hash256;

  inline Hash256 xor_distance(const Hash256 &a, const Hash256 &b) {
    Hash256 x0r = a;
    constexpr auto size = Hash256().size();
    // calculate XOR in-place
    for (size_t i = 0u; i < size; ++i) {
      x0r[i] ^= b[i];
    }
    return x0r;
  }

  /**
   * Position of a key or a peer in the XOR metric space: SHA-256 of its bytes
   */
  class NodeId {
   public:
    explicit NodeId(const Hash256 &h) : data_(h) {}

    static outcome::result<NodeId> hashOf(BytesIn key) {
      OUTCOME_TRY(digest, crypto::sha256(key));
      return NodeId{digest};
    }

    static outcome::result<NodeId> hashOf(const peer::PeerId &peer_id) {
      return hashOf(peer_id.toVector());
    }

    bool operator==(const NodeId &other) const {
      return data_ == other.data_;
    }

    Hash256 distance(const NodeId &other) const {
      return xor_distance(data_, other.data_);
    }

    const Hash256 &getData() const {
      return data_;
    }

   private:
    Hash256 data_;
  };

  /// Orders by XOR distance to @var from, closest first
  struct XorDistanceComparator {
    bool operator()(const NodeId &a, const NodeId &b) const {
      auto d1 = a.distance(from);
      auto d2 = b.distance(from);
      constexpr auto size = Hash256().size();

      // return true, if distance d1 is less than d2, false otherwise
      return std::memcmp(d1.data(), d2.data(), size) < 0;
    }

    NodeId from;
  };

}  // namespace peerscout::local
