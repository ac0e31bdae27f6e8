/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/log/logger.hpp>

#include <boost/assert.hpp>

namespace peerscout::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::shared_ptr<soralog::LoggingSystem> logging_system_{};

    inline void ensureLoggingSystemIsInitialized() {
      BOOST_ASSERT_MSG(logging_system_,
                       "Logging system is not ready. "
                       "setLoggingSystem() must be executed once before");
    }

    template <typename... Args>
    Logger create(const std::string &tag, const Args &...args) {
      ensureLoggingSystemIsInitialized();
      return std::dynamic_pointer_cast<soralog::LoggerFactory>(logging_system_)
          ->getLogger(tag, args...);
    }
  }  // namespace

  void setLoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
  }

  Logger createLogger(const std::string &tag) {
    return create(tag, defaultGroupName);
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return create(tag, group);
  }

  void setLevelOfGroup(const std::string &group_name, Level level) {
    ensureLoggingSystemIsInitialized();
    logging_system_->setLevelOfGroup(group_name, level);
  }

}  // namespace peerscout::log
