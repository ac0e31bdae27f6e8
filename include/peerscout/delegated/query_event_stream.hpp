/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>

#include <peerscout/delegated/http_client.hpp>
#include <peerscout/delegated/query_event.hpp>
#include <peerscout/log/sublogger.hpp>

namespace peerscout::delegated {

  /**
   * Events of one delegated query, read from the response body on demand:
   * body is read only when no complete event is buffered
   */
  class QueryEventStream
      : public std::enable_shared_from_this<QueryEventStream> {
   public:
    /// Empty optional marks the end of the reply
    using EventHandler =
        std::function<void(outcome::result<std::optional<QueryEvent>>)>;

    QueryEventStream(std::shared_ptr<HttpExchange> exchange,
                     std::string_view name);

    /**
     * Requests the next event, the request is sent on the first call.
     * Handler is not called once the stream is closed
     */
    void next(EventHandler handler);

    /// Aborts the exchange
    void close();

   private:
    void onStatus(outcome::result<unsigned> status);

    void onChunk(outcome::result<std::optional<std::string>> chunk);

    void deliver(outcome::result<std::optional<QueryEvent>> result);

    static std::atomic_size_t instance_number;

    std::shared_ptr<HttpExchange> exchange_;
    QueryEventReader reader_;
    EventHandler pending_;
    bool started_ = false;
    bool status_ok_ = false;
    bool eof_ = false;
    bool closed_ = false;
    std::optional<std::error_code> error_;

    log::SubLogger log_;
  };

}  // namespace peerscout::delegated
