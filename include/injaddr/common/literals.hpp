/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <vector>

#include <injaddr/common/types.hpp>

namespace injaddr::common {
  /// Hex digits of any case, even count
  std::vector<uint8_t> operator""_unhex(const char *c, std::size_t s);

  /// 40 hex digits without "0x"
  AddressBytes operator""_address(const char *c, std::size_t s);
}  // namespace injaddr::common
