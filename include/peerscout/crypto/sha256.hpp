/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include <peerscout/common/types.hpp>

namespace peerscout::crypto {

  enum class HashError {
    FAILED_INITIALIZE_CONTEXT = 1,
    FAILED_UPDATE_DIGEST,
    FAILED_FINALIZE_DIGEST,
  };

  Q_ENUM_ERROR_CODE(HashError) {
    using E = decltype(e);
    switch (e) {
      case E::FAILED_INITIALIZE_CONTEXT:
        return "Failed to initialize hash context";
      case E::FAILED_UPDATE_DIGEST:
        return "Failed to update hash digest";
      case E::FAILED_FINALIZE_DIGEST:
        return "Failed to finalize hash digest";
    }
    abort();
  }

  /**
   * Take a SHA-256 hash from bytes
   * @param input to be hashed
   * @return hashed bytes
   */
  outcome::result<common::Hash256> sha256(BytesIn input);

}  // namespace peerscout::crypto
