/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace peerscout::common {
  /// Hash256 as a sequence of 32 bytes
  using Hash256 = std::array<uint8_t, 32u>;
}  // namespace peerscout::common

namespace peerscout {

  /// @brief convenience alias for arrays of bytes
  using Bytes = std::vector<uint8_t>;

  /// @brief convenience alias for immutable span of bytes
  using BytesIn = std::span<const uint8_t>;

}  // namespace peerscout
