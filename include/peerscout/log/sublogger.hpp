/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <fmt/format.h>

#include <peerscout/log/logger.hpp>

namespace peerscout::log {

  /// Logger which prefixes every line with the name of the emitting instance,
  /// e.g. "FindPeer#12: ", so that concurrent lookups can be told apart
  class SubLogger {
   public:
    SubLogger(const std::string &tag,
              const std::string &group,
              std::string_view prefix,
              size_t instance)
        : log_(log::createLogger(tag, group)),
          prefix_(fmt::format("{}#{}: ", prefix, instance)),
          prefix_size_(prefix_.size()) {}

    template <typename... Args>
    void debug(std::string_view fmt, const Args &...args) {
      if (log_->level() >= Level::DEBUG) {
        prefix_.append(fmt.data(), fmt.size());
        log_->debug(prefix_, args...);
        prefix_.resize(prefix_size_);
      }
    }

   private:
    log::Logger log_;
    std::string prefix_;
    const size_t prefix_size_;
  };

}  // namespace peerscout::log
