/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace peerscout::delegated {

  using namespace std::chrono_literals;

  /**
   * Delegate node, which exposes IPFS-style HTTP API
   */
  struct Config {
    std::string host = "127.0.0.1";

    uint16_t port = 5001;

    /// Transport timeout of a single request
    std::chrono::milliseconds timeout = 30s;

    std::string apiPath = "/api/v0";
  };

}  // namespace peerscout::delegated
