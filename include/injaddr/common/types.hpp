/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace injaddr::common {
  /// Length of an account identifier shared by EVM and Cosmos-SDK formats
  constexpr size_t kAddressLength = 20;

  /// Canonical account identifier as a sequence of 20 bytes
  using AddressBytes = std::array<uint8_t, kAddressLength>;
}  // namespace injaddr::common

namespace injaddr {

  /// @brief convenience alias for arrays of bytes
  using Bytes = std::vector<uint8_t>;

  /// @brief convenience alias for immutable span of bytes
  using BytesIn = std::span<const uint8_t>;

}  // namespace injaddr
