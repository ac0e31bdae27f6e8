/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <deque>

#include <peerscout/delegated/http_client.hpp>

#include <gmock/gmock.h>

namespace peerscout::delegated {

  struct HttpClientMock : public HttpClient {
    ~HttpClientMock() override = default;

    MOCK_METHOD(std::shared_ptr<HttpExchange>, post, (std::string), (override));
  };

  /**
   * Exchange with scripted reply: answers synchronously unless
   * @var hold_start is set
   */
  struct FakeHttpExchange : public HttpExchange {
    FakeHttpExchange(outcome::result<unsigned> status,
                     std::deque<std::string> chunks)
        : status{status}, chunks{std::move(chunks)} {}

    void start(StatusHandler handler) override {
      ++starts;
      if (hold_start) {
        start_handler = std::move(handler);
        return;
      }
      handler(status);
    }

    void read(ChunkHandler handler) override {
      ++reads;
      if (chunks.empty()) {
        handler(std::nullopt);
        return;
      }
      auto chunk = std::move(chunks.front());
      chunks.pop_front();
      handler(std::move(chunk));
    }

    void close() override {
      closed = true;
      start_handler = nullptr;
    }

    outcome::result<unsigned> status;
    std::deque<std::string> chunks;
    bool hold_start = false;

    StatusHandler start_handler;
    size_t starts = 0;
    size_t reads = 0;
    bool closed = false;
  };

}  // namespace peerscout::delegated
