/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>

#include <qtils/enum_error_code.hpp>

namespace peerscout::routing {

  enum class RoutingError {
    NO_ROUTERS_AVAILABLE = 1,
    NOT_FOUND,
    TIMEOUT,
    CANCELLED,
    IN_PROGRESS,
  };

  Q_ENUM_ERROR_CODE(RoutingError) {
    using E = decltype(e);
    switch (e) {
      case E::NO_ROUTERS_AVAILABLE:
        return "No peer routers available";
      case E::NOT_FOUND:
        return "Peer is not found by any router";
      case E::TIMEOUT:
        return "Operation timed out";
      case E::CANCELLED:
        return "Operation is cancelled";
      case E::IN_PROGRESS:
        return "Previous operation is still in progress";
    }
    abort();
  }

}  // namespace peerscout::routing
