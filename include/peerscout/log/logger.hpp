/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

namespace peerscout::log {

  using Level = soralog::Level;
  using Logger = std::shared_ptr<soralog::Logger>;

  inline const std::string defaultGroupName("peerscout");

  /// Must be called once before any logger is created
  void setLoggingSystem(std::shared_ptr<soralog::LoggingSystem> logging_system);

  [[nodiscard]] Logger createLogger(const std::string &tag);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);

  void setLevelOfGroup(const std::string &group_name, Level level);

}  // namespace peerscout::log
