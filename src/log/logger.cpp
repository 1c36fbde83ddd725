/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <injaddr/log/logger.hpp>

#include <stdexcept>

namespace injaddr::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::shared_ptr<soralog::LoggingSystem> logging_system_{};

    const std::shared_ptr<soralog::LoggingSystem> &loggingSystem() {
      if (not logging_system_) {
        throw std::logic_error(
            "Logging system is not ready. "
            "setLoggingSystem() must be executed once before");
      }
      return logging_system_;
    }
  }  // namespace

  void setLoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return loggingSystem()->getLogger(tag, group);
  }

  void setLevelOfGroup(const std::string &group_name, Level level) {
    loggingSystem()->setLevelOfGroup(group_name, level);
  }

}  // namespace injaddr::log
