/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstddef>
#include <string_view>

namespace peerscout::multi {

  /**
   * Network protocol which may appear in a textual multiaddress
   */
  struct Protocol {
    enum class Code : std::size_t {
      IP4 = 4,
      TCP = 6,
      IP6 = 41,
      DNS = 53,
      DNS4 = 54,
      DNS6 = 55,
      DNS_ADDR = 56,
      UDP = 273,
      P2P_CIRCUIT = 290,
      P2P = 421,
      HTTPS = 443,
      QUIC = 460,
      QUIC_V1 = 461,
      WS = 477,
      WSS = 478,
      HTTP = 480,
    };

    /// Format of the value following the protocol name
    enum class Value {
      NONE,
      IP4,
      IP6,
      PORT,
      HOST,
      PEER_ID,
    };

    constexpr bool operator==(const Protocol &p) const {
      return code == p.code;
    }

    Code code;
    Value value;
    std::string_view name;
  };

  class ProtocolList {
   public:
    static constexpr std::size_t kProtocolsNum = 16;

    /// @return protocol with given name, nullptr if unknown
    static constexpr const Protocol *get(std::string_view name) {
      if (name == "ipfs") {
        name = "p2p";  // legacy name
      }
      for (const auto &protocol : protocols_) {
        if (protocol.name == name) {
          return &protocol;
        }
      }
      return nullptr;
    }

   private:
    using C = Protocol::Code;
    using V = Protocol::Value;

    static constexpr std::array<Protocol, kProtocolsNum> protocols_ = {
        Protocol{C::IP4, V::IP4, "ip4"},
        {C::TCP, V::PORT, "tcp"},
        {C::IP6, V::IP6, "ip6"},
        {C::DNS, V::HOST, "dns"},
        {C::DNS4, V::HOST, "dns4"},
        {C::DNS6, V::HOST, "dns6"},
        {C::DNS_ADDR, V::HOST, "dnsaddr"},
        {C::UDP, V::PORT, "udp"},
        {C::P2P_CIRCUIT, V::NONE, "p2p-circuit"},
        {C::P2P, V::PEER_ID, "p2p"},
        {C::HTTPS, V::NONE, "https"},
        {C::QUIC, V::NONE, "quic"},
        {C::QUIC_V1, V::NONE, "quic-v1"},
        {C::WS, V::NONE, "ws"},
        {C::WSS, V::NONE, "wss"},
        {C::HTTP, V::NONE, "http"},
    };
  };

}  // namespace peerscout::multi
