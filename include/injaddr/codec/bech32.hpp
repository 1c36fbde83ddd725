/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <injaddr/codec/bech32_error.hpp>
#include <injaddr/common/types.hpp>
#include <injaddr/outcome/outcome.hpp>

/**
 * Encode/decode to/from bech32 format as specified by BIP-173.
 * Only the original bech32 checksum constant is supported, not bech32m.
 */
namespace injaddr::codec {

  /// Upper bound of a whole bech32 string
  constexpr size_t kMaxBech32Length = 90;

  /// Number of checksum characters appended to the data part
  constexpr size_t kChecksumLength = 6;

  constexpr char kSeparator = '1';

  /// Decoded bech32 string
  struct Bech32Data {
    /// human-readable part, lowercase
    std::string prefix;
    /// 5-bit groups, checksum excluded
    Bytes data;
  };

  /**
   * Check if the prefix may be used as a human-readable part
   * @param prefix to be checked
   * @return true if prefix is non-empty, printable US-ASCII and not uppercase
   */
  bool isValidPrefix(std::string_view prefix);

  /**
   * Encode 5-bit groups to a bech32 string
   * @param prefix - human-readable part
   * @param data - 5-bit groups
   * @return prefix + "1" + data chars + checksum chars
   */
  outcome::result<std::string> encode(std::string_view prefix, BytesIn data);

  /**
   * Regroup bytes into 5-bit groups and encode them
   * @param prefix - human-readable part
   * @param bytes to be encoded
   * @return bech32 string
   */
  outcome::result<std::string> encodeBytes(std::string_view prefix,
                                           BytesIn bytes);

  /**
   * Decode a bech32 string, verifying its checksum
   * @param address to be decoded; all-uppercase input is accepted
   * @return prefix and 5-bit groups in case of success
   */
  outcome::result<Bech32Data> decode(std::string_view address);

  /**
   * Regroup a sequence of from_bits-wide values into to_bits-wide values,
   * most significant bit first
   * @param data - values, each below 2^from_bits
   * @param from_bits - width of input values
   * @param to_bits - width of output values
   * @param pad - zero-pad the last output value; if false, leftover bits must
   * be fewer than from_bits and all zero
   * @return regrouped values
   */
  outcome::result<Bytes> convertBits(BytesIn data,
                                     unsigned from_bits,
                                     unsigned to_bits,
                                     bool pad);

}  // namespace injaddr::codec
