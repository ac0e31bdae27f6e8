/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/peer/peer_id.hpp>

#include <optional>

#include <boost/container_hash/hash.hpp>

#include <peerscout/multi/base58.hpp>

namespace peerscout::peer {

  namespace {
    constexpr uint64_t kIdentityCode = 0x00;
    constexpr uint64_t kSha256Code = 0x12;

    /// Reads unsigned varint at @param pos, advances it
    std::optional<uint64_t> readUvarint(BytesIn bytes, size_t &pos) {
      uint64_t value = 0;
      for (size_t shift = 0; pos < bytes.size() and shift < 64; shift += 7) {
        auto byte = bytes[pos++];
        value |= static_cast<uint64_t>(byte & 0x7f) << shift;
        if ((byte & 0x80) == 0) {
          return value;
        }
      }
      return std::nullopt;
    }
  }  // namespace

  PeerId::PeerId(Bytes bytes) : bytes_(std::move(bytes)) {}

  PeerId::FactoryResult PeerId::fromBytes(BytesIn v) {
    if (v.empty()) {
      return FactoryError::EMPTY;
    }
    size_t pos = 0;
    auto code = readUvarint(v, pos);
    if (not code or (*code != kIdentityCode and *code != kSha256Code)) {
      return FactoryError::UNSUPPORTED_HASH;
    }
    auto length = readUvarint(v, pos);
    if (not length or *length != v.size() - pos) {
      return FactoryError::LENGTH_MISMATCH;
    }
    if (*code == kSha256Code and *length != 32) {
      return FactoryError::LENGTH_MISMATCH;
    }
    return PeerId{Bytes(v.begin(), v.end())};
  }

  PeerId::FactoryResult PeerId::fromBase58(std::string_view id) {
    OUTCOME_TRY(bytes, multi::detail::decodeBase58(id));
    return fromBytes(bytes);
  }

  std::string PeerId::toBase58() const {
    return multi::detail::encodeBase58(bytes_);
  }

  const Bytes &PeerId::toVector() const {
    return bytes_;
  }

}  // namespace peerscout::peer

size_t std::hash<peerscout::peer::PeerId>::operator()(
    const peerscout::peer::PeerId &peer_id) const {
  return boost::hash_range(peer_id.toVector().begin(),
                           peer_id.toVector().end());
}
