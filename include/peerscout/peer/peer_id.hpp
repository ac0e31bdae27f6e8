/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include <peerscout/common/types.hpp>

namespace peerscout::peer {

  /**
   * Unique identifier of the peer: multihash, usually SHA-256 of the peer's
   * public key or the key itself inlined with identity multihash.
   * The routing layer treats it as an opaque comparable value
   */
  class PeerId {
    using FactoryResult = outcome::result<PeerId>;

   public:
    enum class FactoryError {
      EMPTY = 1,
      UNSUPPORTED_HASH,
      LENGTH_MISMATCH,
    };

    /// Creates PeerId from the serialized multihash
    static FactoryResult fromBytes(BytesIn v);

    /// Creates PeerId from base58 (not multibase) text
    static FactoryResult fromBase58(std::string_view id);

    /// @return base58 text form
    std::string toBase58() const;

    /// @return serialized multihash
    const Bytes &toVector() const;

    bool operator==(const PeerId &other) const = default;
    bool operator<(const PeerId &other) const {
      return bytes_ < other.bytes_;
    }

   private:
    explicit PeerId(Bytes bytes);

    Bytes bytes_;
  };

  Q_ENUM_ERROR_CODE(PeerId::FactoryError) {
    using E = decltype(e);
    switch (e) {
      case E::EMPTY:
        return "PeerId: empty input";
      case E::UNSUPPORTED_HASH:
        return "PeerId: multihash is neither identity nor sha2-256";
      case E::LENGTH_MISMATCH:
        return "PeerId: multihash length does not match the digest";
    }
    abort();
  }

}  // namespace peerscout::peer

namespace std {
  template <>
  struct hash<peerscout::peer::PeerId> {
    size_t operator()(const peerscout::peer::PeerId &peer_id) const;
  };
}  // namespace std

template <>
struct fmt::formatter<peerscout::peer::PeerId> {
  // 's' - last 6 characters only, 'l' - full base58
  char presentation = 's';

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin(), end = ctx.end();
    if (it != end && (*it == 's' || *it == 'l')) {
      presentation = *it++;
    }
    if (it != end && *it != '}') {
      throw format_error("invalid format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const peerscout::peer::PeerId &peer_id, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    auto b58 = peer_id.toBase58();
    if (presentation == 's' and b58.size() > 6) {
      return fmt::format_to(ctx.out(), "…{}", b58.substr(b58.size() - 6));
    }
    return fmt::format_to(ctx.out(), "{}", b58);
  }
};
