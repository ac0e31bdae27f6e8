/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <cstddef>

#include <peerscout/peer/address_repository.hpp>

namespace peerscout::routing {

  using namespace std::chrono_literals;

  struct RefreshManagerConfig {
    /// Periodic refresh of the routing table is on
    bool enabled = true;

    /// Delay of the first refresh after start
    std::chrono::milliseconds bootDelay = 10s;

    /// Delay between the end of one refresh and the start of the next
    std::chrono::milliseconds interval = 10min;

    /// TTL of addresses learnt by refresh
    std::chrono::milliseconds addressTtl = peer::ttl::kDay;
  };

  struct Config {
    RefreshManagerConfig refreshManager;

    /// Max number of records yielded by a local closest peers query
    size_t closestPeersCount = 20;
  };

}  // namespace peerscout::routing
