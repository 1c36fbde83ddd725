/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace injaddr::address {
  /**
   * Config of address converter
   */
  struct ConverterConfig {
    /// bech32 prefix reserved for the target chain
    static constexpr std::string_view kDefaultTargetPrefix = "inj";
    std::string target_prefix{kDefaultTargetPrefix};

    /// how many addresses a single batch may contain
    static constexpr size_t kDefaultMaxBatchSize = 50;
    size_t max_batch_size = kDefaultMaxBatchSize;
  };
}  // namespace injaddr::address
