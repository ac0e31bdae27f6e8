/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/delegated/query_event.hpp>

#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <nlohmann/json.hpp>

#include <peerscout/delegated/error.hpp>

namespace peerscout::delegated {

  using json = nlohmann::json;

  namespace {
    /// @return value of the field, nullptr if absent or null
    const json *field(const json &object, std::string_view name) {
      for (auto it = object.begin(); it != object.end(); ++it) {
        if (boost::algorithm::iequals(it.key(), name)) {
          return it.value().is_null() ? nullptr : &it.value();
        }
      }
      return nullptr;
    }

    outcome::result<std::string> stringField(const json &object,
                                             std::string_view name) {
      auto value = field(object, name);
      if (value == nullptr) {
        return std::string{};
      }
      if (not value->is_string()) {
        return DelegatedError::MALFORMED_RESPONSE;
      }
      return value->get<std::string>();
    }

    outcome::result<QueryEvent::Response> parseResponse(const json &object) {
      if (not object.is_object()) {
        return DelegatedError::MALFORMED_RESPONSE;
      }
      QueryEvent::Response response;
      OUTCOME_TRY(id, stringField(object, "id"));
      response.id = std::move(id);
      if (auto addrs = field(object, "addrs")) {
        if (not addrs->is_array()) {
          return DelegatedError::MALFORMED_RESPONSE;
        }
        for (const auto &addr : *addrs) {
          if (not addr.is_string()) {
            return DelegatedError::MALFORMED_RESPONSE;
          }
          response.addrs.emplace_back(addr.get<std::string>());
        }
      }
      return response;
    }
  }  // namespace

  outcome::result<QueryEvent> parseQueryEvent(std::string_view line) {
    json object;
    try {
      object = json::parse(line.begin(), line.end());
    } catch (const json::parse_error &) {
      return DelegatedError::MALFORMED_RESPONSE;
    }
    if (not object.is_object()) {
      return DelegatedError::MALFORMED_RESPONSE;
    }

    auto type = field(object, "type");
    if (type == nullptr or not type->is_number_integer()) {
      return DelegatedError::MALFORMED_RESPONSE;
    }

    QueryEvent event{};
    event.type = static_cast<QueryEventType>(type->get<int>());
    OUTCOME_TRY(id, stringField(object, "id"));
    event.id = std::move(id);
    OUTCOME_TRY(extra, stringField(object, "extra"));
    event.extra = std::move(extra);

    if (auto responses = field(object, "responses")) {
      if (not responses->is_array()) {
        return DelegatedError::MALFORMED_RESPONSE;
      }
      for (const auto &item : *responses) {
        OUTCOME_TRY(response, parseResponse(item));
        event.responses.emplace_back(std::move(response));
      }
    }
    return event;
  }

  outcome::result<peer::PeerInfo> toPeerInfo(
      const QueryEvent::Response &response) {
    auto peer_id = peer::PeerId::fromBase58(response.id);
    if (peer_id.has_error()) {
      return DelegatedError::MALFORMED_RESPONSE;
    }
    peer::PeerInfo peer_info{peer_id.value(), {}};
    for (const auto &addr : response.addrs) {
      auto ma = multi::Multiaddress::create(addr);
      if (ma.has_error()) {
        return DelegatedError::MALFORMED_RESPONSE;
      }
      peer_info.addresses.emplace_back(std::move(ma.value()));
    }
    return peer_info;
  }

  void QueryEventReader::feed(std::string_view chunk) {
    buffer_.append(chunk);
  }

  outcome::result<std::optional<QueryEvent>> QueryEventReader::next() {
    while (true) {
      auto pos = buffer_.find('\n');
      if (pos == std::string::npos) {
        return std::nullopt;
      }
      auto line = buffer_.substr(0, pos);
      buffer_.erase(0, pos + 1);
      boost::algorithm::trim(line);
      if (line.empty()) {
        continue;
      }
      OUTCOME_TRY(event, parseQueryEvent(line));
      return std::move(event);
    }
  }

  outcome::result<std::optional<QueryEvent>> QueryEventReader::finish() {
    auto line = std::move(buffer_);
    buffer_.clear();
    boost::algorithm::trim(line);
    if (line.empty()) {
      return std::nullopt;
    }
    OUTCOME_TRY(event, parseQueryEvent(line));
    return std::move(event);
  }

}  // namespace peerscout::delegated
