/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <injaddr/log/configurator.hpp>

namespace injaddr::log {

  namespace {
    const std::string embedded_config(R"(
# This is injaddr configuration part of logging system
# ------------- Begin of injaddr config --------------
groups:
  - name: injaddr
    level: off
    children:
      - name: address
      - name: cli
# --------------- End of injaddr config ---------------)");
  }

  Configurator::Configurator() : ConfiguratorFromYAML(embedded_config) {}

  Configurator::Configurator(std::string config)
      : soralog::ConfiguratorFromYAML(std::move(config)) {}

}  // namespace injaddr::log
