/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <qtils/outcome.hpp>

namespace peerscout::delegated {

  /**
   * Single HTTP request with incrementally read response body
   */
  class HttpExchange {
   public:
    using StatusHandler = std::function<void(outcome::result<unsigned>)>;

    /// Empty optional marks the end of the body
    using ChunkHandler =
        std::function<void(outcome::result<std::optional<std::string>>)>;

    virtual ~HttpExchange() = default;

    /// Sends request and reads response header
    virtual void start(StatusHandler handler) = 0;

    /// Reads next piece of response body, may be called after start() only
    virtual void read(ChunkHandler handler) = 0;

    /// Aborts the exchange, pending handlers are not called
    virtual void close() = 0;
  };

  class HttpClient {
   public:
    virtual ~HttpClient() = default;

    /**
     * Prepares POST request with empty body
     * @param target path with query string
     */
    virtual std::shared_ptr<HttpExchange> post(std::string target) = 0;
  };

}  // namespace peerscout::delegated
