/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <boost/algorithm/hex.hpp>

#include <injaddr/common/types.hpp>
#include <injaddr/outcome/outcome.hpp>

namespace injaddr::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError { NOT_ENOUGH_INPUT = 1, NON_HEX_INPUT, UNKNOWN };

  /**
   * @brief Converts bytes to hex representation
   * @param bytes to be converted
   * @return lowercase hexstring without prefix
   */
  inline std::string hex_lower(BytesIn bytes) noexcept {
    std::string res(bytes.size() * 2, '\x00');
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(), res.begin());
    return res;
  }

  /**
   * @brief Converts hex representation to bytes
   * @param hex individual chars, without "0x"
   * @return result containing array of bytes if input string is hex encoded and
   * has even length
   *
   * @note reads both uppercase and lowercase hexstrings
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

  /**
   * @brief Parses exactly 40 hex digits into a canonical address
   * @param hex digits without "0x", any case
   * @return address bytes, NOT_ENOUGH_INPUT if the length is not 40
   */
  outcome::result<AddressBytes> unhexAddress(std::string_view hex);
}  // namespace injaddr::common

OUTCOME_HPP_DECLARE_ERROR(injaddr::common, UnhexError);
