/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdlib>
#include <string>
#include <string_view>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include <peerscout/common/types.hpp>

namespace peerscout::multi {
  enum class BaseError {
    INVALID_BASE58_INPUT = 1,
  };
  Q_ENUM_ERROR_CODE(BaseError) {
    using E = decltype(e);
    switch (e) {
      case E::INVALID_BASE58_INPUT:
        return "Input is not a valid base58 encoded string";
    }
    abort();
  }
}  // namespace peerscout::multi

/**
 * Bitcoin alphabet base58, as used for textual peer ids
 */
namespace peerscout::multi::detail {

  std::string encodeBase58(BytesIn bytes);

  outcome::result<Bytes> decodeBase58(std::string_view string);

}  // namespace peerscout::multi::detail
