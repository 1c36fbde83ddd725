/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace injaddr::log {

  /// Logging groups of the library, embedded as YAML
  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    Configurator();

    explicit Configurator(std::string config);
  };

}  // namespace injaddr::log
