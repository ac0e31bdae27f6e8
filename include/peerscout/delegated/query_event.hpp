/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <qtils/outcome.hpp>

#include <peerscout/peer/peer_info.hpp>

namespace peerscout::delegated {

  /// Kind of DHT query event reported by the delegate node
  enum class QueryEventType : int {
    SENDING_QUERY = 0,
    PEER_RESPONSE = 1,
    FINAL_PEER = 2,
    QUERY_ERROR = 3,
    PROVIDER = 4,
    VALUE = 5,
    ADDING_PEER = 6,
    DIALING_PEER = 7,
  };

  /**
   * One line of newline-delimited JSON reply:
   * {"Type":2,"ID":"...","Extra":"","Responses":[{"ID":"...","Addrs":[...]}]}
   * Ids and addresses are kept as text, only consumed events are validated
   */
  struct QueryEvent {
    struct Response {
      std::string id;
      std::vector<std::string> addrs;
    };

    QueryEventType type;
    std::string id;
    std::string extra;
    std::vector<Response> responses;
  };

  /// Parses single line, field names are case-insensitive
  outcome::result<QueryEvent> parseQueryEvent(std::string_view line);

  /// Validates peer id and addresses of the response
  outcome::result<peer::PeerInfo> toPeerInfo(
      const QueryEvent::Response &response);

  /**
   * Splits body chunks into lines and parses them
   */
  class QueryEventReader {
   public:
    void feed(std::string_view chunk);

    /// @return next complete event, empty if more input is needed
    outcome::result<std::optional<QueryEvent>> next();

    /// @return event of the unterminated last line, if any
    outcome::result<std::optional<QueryEvent>> finish();

   private:
    std::string buffer_;
  };

}  // namespace peerscout::delegated
