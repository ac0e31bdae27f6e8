/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/multi/multiaddress.hpp>

#include <charconv>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/asio/ip/address.hpp>

#include <peerscout/multi/base58.hpp>

namespace {
  using peerscout::multi::Protocol;

  bool isValidPort(std::string_view value) {
    uint16_t port = 0;
    auto end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(value.data(), end, port);
    return not value.empty() and ec == std::errc{} and ptr == end;
  }

  bool isValidValue(Protocol::Value format, const std::string &value) {
    boost::system::error_code ec;
    switch (format) {
      case Protocol::Value::NONE:
        return true;
      case Protocol::Value::IP4:
        std::ignore = boost::asio::ip::make_address_v4(value, ec);
        return not ec;
      case Protocol::Value::IP6:
        std::ignore = boost::asio::ip::make_address_v6(value, ec);
        return not ec;
      case Protocol::Value::PORT:
        return isValidPort(value);
      case Protocol::Value::HOST:
        return not value.empty();
      case Protocol::Value::PEER_ID:
        return not value.empty()
           and peerscout::multi::detail::decodeBase58(value).has_value();
    }
    return false;
  }
}  // namespace

namespace peerscout::multi {

  Multiaddress::Multiaddress(
      std::string address, std::vector<std::pair<Protocol, std::string>> parts)
      : stringified_address_{std::move(address)}, parts_{std::move(parts)} {}

  Multiaddress::FactoryResult Multiaddress::create(std::string_view address) {
    if (address.size() < 2 or address.front() != '/') {
      return Error::INVALID_INPUT;
    }
    if (address.back() == '/') {
      address.remove_suffix(1);
    }

    std::vector<std::string> tokens;
    boost::algorithm::split(
        tokens, address.substr(1), boost::algorithm::is_any_of("/"));

    std::vector<std::pair<Protocol, std::string>> parts;
    std::string normalized;
    for (auto it = tokens.begin(); it != tokens.end(); ++it) {
      if (it->empty()) {
        return Error::INVALID_INPUT;
      }
      auto protocol = ProtocolList::get(*it);
      if (protocol == nullptr) {
        return Error::PROTOCOL_NOT_FOUND;
      }
      normalized += '/';
      normalized += protocol->name;
      if (protocol->value == Protocol::Value::NONE) {
        parts.emplace_back(*protocol, std::string{});
        continue;
      }
      if (++it == tokens.end() or not isValidValue(protocol->value, *it)) {
        return Error::INVALID_PROTOCOL_VALUE;
      }
      normalized += '/';
      normalized += *it;
      parts.emplace_back(*protocol, *it);
    }

    return Multiaddress{std::move(normalized), std::move(parts)};
  }

  std::string_view Multiaddress::getStringAddress() const {
    return stringified_address_;
  }

  const std::vector<std::pair<Protocol, std::string>> &
  Multiaddress::getProtocolsWithValues() const {
    return parts_;
  }

  bool Multiaddress::operator==(const Multiaddress &other) const {
    return stringified_address_ == other.stringified_address_;
  }

  bool Multiaddress::operator<(const Multiaddress &other) const {
    return stringified_address_ < other.stringified_address_;
  }

}  // namespace peerscout::multi

size_t std::hash<peerscout::multi::Multiaddress>::operator()(
    const peerscout::multi::Multiaddress &x) const {
  return std::hash<std::string_view>()(x.getStringAddress());
}
