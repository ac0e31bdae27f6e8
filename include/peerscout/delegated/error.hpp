/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>

#include <qtils/enum_error_code.hpp>

namespace peerscout::delegated {

  enum class DelegatedError {
    BAD_STATUS = 1,
    MALFORMED_RESPONSE,
    QUERY_FAILED,
    CONNECTION_FAILED,
  };

  Q_ENUM_ERROR_CODE(DelegatedError) {
    using E = decltype(e);
    switch (e) {
      case E::BAD_STATUS:
        return "Delegate node replied with unexpected HTTP status";
      case E::MALFORMED_RESPONSE:
        return "Delegate node reply can not be parsed";
      case E::QUERY_FAILED:
        return "Delegate node reported query error";
      case E::CONNECTION_FAILED:
        return "Connection to delegate node failed";
    }
    abort();
  }

}  // namespace peerscout::delegated
