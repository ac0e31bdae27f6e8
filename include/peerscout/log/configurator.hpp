/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <soralog/impl/configurator_from_yaml.hpp>

namespace peerscout::log {

  /// Logging configuration with the group tree of the library embedded
  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    Configurator();
  };

}  // namespace peerscout::log
