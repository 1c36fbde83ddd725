/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <injaddr/common/literals.hpp>

#include <injaddr/common/hexutil.hpp>

namespace injaddr::common {
  std::vector<uint8_t> operator""_unhex(const char *c, std::size_t s) {
    return unhex(std::string_view(c, s)).value();
  }

  AddressBytes operator""_address(const char *c, std::size_t s) {
    return unhexAddress(std::string_view(c, s)).value();
  }
}  // namespace injaddr::common
