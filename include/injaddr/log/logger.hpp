/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

namespace injaddr::log {

  using Level = soralog::Level;
  using Logger = std::shared_ptr<soralog::Logger>;

  /// Root of the library groups, see Configurator
  inline const std::string defaultGroupName("injaddr");
  inline const std::string addressGroupName("address");
  inline const std::string cliGroupName("cli");

  /**
   * Install the logging system every logger is created from. Must be called
   * once before the first createLogger()
   */
  void setLoggingSystem(std::shared_ptr<soralog::LoggingSystem> logging_system);

  /**
   * @throws std::logic_error if no logging system is installed
   */
  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);

  /**
   * @throws std::logic_error if no logging system is installed
   */
  void setLevelOfGroup(const std::string &group_name, Level level);

}  // namespace injaddr::log
