/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>

#include <qtils/enum_error_code.hpp>

namespace peerscout::peer {

  enum class PeerError { NOT_FOUND = 1 };

  Q_ENUM_ERROR_CODE(PeerError) {
    using E = decltype(e);
    switch (e) {
      case E::NOT_FOUND:
        return "not found";
    }
    abort();
  }

}  // namespace peerscout::peer
