/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include <peerscout/multi/multiaddress_protocol_list.hpp>

namespace peerscout::multi {

  /**
   * Address format, used by libp2p peers: composable sequence of
   * "/protocol/value" parts, like "/ip4/127.0.0.1/tcp/4001/p2p/Qm..."
   * Kept in normalized textual form, validated on creation
   */
  class Multiaddress {
    using FactoryResult = outcome::result<Multiaddress>;

   public:
    Multiaddress() = delete;

    enum class Error {
      INVALID_INPUT = 1,       ///< input is not a multiaddress
      PROTOCOL_NOT_FOUND,      ///< unknown protocol name
      INVALID_PROTOCOL_VALUE,  ///< value does not match protocol format
    };

    /**
     * Parses and validates textual multiaddress
     * @param address, trailing slash is allowed
     */
    static FactoryResult create(std::string_view address);

    /// @return normalized textual form
    std::string_view getStringAddress() const;

    /// @return protocols with their values, empty for value-less protocols
    const std::vector<std::pair<Protocol, std::string>> &
    getProtocolsWithValues() const;

    bool operator==(const Multiaddress &other) const;

    bool operator<(const Multiaddress &other) const;

   private:
    Multiaddress(std::string address,
                 std::vector<std::pair<Protocol, std::string>> parts);

    std::string stringified_address_;
    std::vector<std::pair<Protocol, std::string>> parts_;
  };

  Q_ENUM_ERROR_CODE(Multiaddress::Error) {
    using E = decltype(e);
    switch (e) {
      case E::INVALID_INPUT:
        return "invalid multiaddress input";
      case E::PROTOCOL_NOT_FOUND:
        return "unknown multiaddress protocol";
      case E::INVALID_PROTOCOL_VALUE:
        return "invalid multiaddress protocol value";
    }
    abort();
  }

}  // namespace peerscout::multi

namespace std {
  template <>
  struct hash<peerscout::multi::Multiaddress> {
    size_t operator()(const peerscout::multi::Multiaddress &x) const;
  };
}  // namespace std

template <>
struct fmt::formatter<peerscout::multi::Multiaddress>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const peerscout::multi::Multiaddress &ma,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(ma.getStringAddress(),
                                                    ctx);
  }
};
