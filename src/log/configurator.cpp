/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <peerscout/log/configurator.hpp>

namespace peerscout::log {

  namespace {
    const std::string embedded_config(R"(
# This is peerscout configuration part of logging system
# ------------- Begin of peerscout config --------------
groups:
  - name: peerscout
    level: off
    children:
      - name: routing
        children:
          - name: refresh
      - name: delegated
      - name: local
      - name: utils
        children:
          - name: scheduler
# --------------- End of peerscout config ---------------)");
  }

  Configurator::Configurator() : ConfiguratorFromYAML(embedded_config) {}

}  // namespace peerscout::log
