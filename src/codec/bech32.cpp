/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <injaddr/codec/bech32.hpp>

#include <array>

namespace {
  using injaddr::Bytes;
  using injaddr::BytesIn;

  constexpr std::string_view kCharset = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

  // clang-format off
  constexpr std::array<int8_t, 128> kCharsetRev = {
      -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
      -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
      -1,-1,-1,-1,-1,-1,-1,-1, -1,-1,-1,-1,-1,-1,-1,-1,
      15,-1,10,17,21,20,26,30,  7, 5,-1,-1,-1,-1,-1,-1,
      -1,29,-1,24,13,25, 9, 8, 23,-1,18,22,31,27,19,-1,
       1, 0, 3,16,11,28,12,14,  6, 4, 2,-1,-1,-1,-1,-1,
      -1,29,-1,24,13,25, 9, 8, 23,-1,18,22,31,27,19,-1,
       1, 0, 3,16,11,28,12,14,  6, 4, 2,-1,-1,-1,-1,-1,
  };
  // clang-format on

  /// Checksum of a valid bech32 string (bech32m would use 0x2bc830a3)
  constexpr uint32_t kBech32Constant = 1;

  constexpr bool isLower(char c) noexcept {
    return c >= 'a' && c <= 'z';
  }

  constexpr bool isUpper(char c) noexcept {
    return c >= 'A' && c <= 'Z';
  }

  constexpr bool isPrintable(char c) noexcept {
    return c >= 33 && c <= 126;
  }

  /**
   * BCH checksum over GF(32) with the BIP-173 generator
   */
  uint32_t polymod(BytesIn values) {
    constexpr std::array<uint32_t, 5> kGenerator = {
        0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3};
    uint32_t chk = 1;
    for (auto v : values) {
      uint8_t top = chk >> 25;
      chk = ((chk & 0x1ffffff) << 5) ^ v;
      for (size_t i = 0; i < kGenerator.size(); ++i) {
        if ((top >> i) & 1) {
          chk ^= kGenerator[i];
        }
      }
    }
    return chk;
  }

  /// High bits of each prefix char, zero, then low bits of each prefix char
  Bytes expandPrefix(std::string_view prefix) {
    Bytes ret;
    ret.reserve(prefix.size() * 2 + 1);
    for (auto c : prefix) {
      ret.push_back(static_cast<uint8_t>(c) >> 5);
    }
    ret.push_back(0);
    for (auto c : prefix) {
      ret.push_back(static_cast<uint8_t>(c) & 0x1f);
    }
    return ret;
  }

  Bytes createChecksum(std::string_view prefix, BytesIn data) {
    auto values = expandPrefix(prefix);
    values.insert(values.end(), data.begin(), data.end());
    values.insert(values.end(), injaddr::codec::kChecksumLength, 0);
    auto mod = polymod(values) ^ kBech32Constant;

    Bytes checksum(injaddr::codec::kChecksumLength);
    for (size_t i = 0; i < checksum.size(); ++i) {
      checksum[i] = (mod >> (5 * (5 - i))) & 0x1f;
    }
    return checksum;
  }

  bool verifyChecksum(std::string_view prefix, BytesIn values) {
    auto expanded = expandPrefix(prefix);
    expanded.insert(expanded.end(), values.begin(), values.end());
    return polymod(expanded) == kBech32Constant;
  }
}  // namespace

namespace injaddr::codec {

  bool isValidPrefix(std::string_view prefix) {
    if (prefix.empty()) {
      return false;
    }
    for (auto c : prefix) {
      if (not isPrintable(c) or isUpper(c)) {
        return false;
      }
    }
    return true;
  }

  outcome::result<std::string> encode(std::string_view prefix, BytesIn data) {
    if (prefix.empty()) {
      return EncodeError::EMPTY_PREFIX;
    }
    if (not isValidPrefix(prefix)) {
      return EncodeError::INVALID_PREFIX_CHARACTER;
    }
    if (prefix.size() + 1 + data.size() + kChecksumLength > kMaxBech32Length) {
      return EncodeError::TOO_LONG;
    }
    for (auto v : data) {
      if (v >= kCharset.size()) {
        return EncodeError::INVALID_DATA_VALUE;
      }
    }

    auto checksum = createChecksum(prefix, data);

    std::string result;
    result.reserve(prefix.size() + 1 + data.size() + checksum.size());
    result.append(prefix);
    result.push_back(kSeparator);
    for (auto v : data) {
      result.push_back(kCharset[v]);
    }
    for (auto v : checksum) {
      result.push_back(kCharset[v]);
    }
    return result;
  }

  outcome::result<std::string> encodeBytes(std::string_view prefix,
                                           BytesIn bytes) {
    OUTCOME_TRY(groups, convertBits(bytes, 8, 5, true));
    return encode(prefix, groups);
  }

  outcome::result<Bech32Data> decode(std::string_view address) {
    bool has_lower = false;
    bool has_upper = false;
    for (auto c : address) {
      if (not isPrintable(c)) {
        return DecodeError::INVALID_CHARACTER;
      }
      has_lower = has_lower or isLower(c);
      has_upper = has_upper or isUpper(c);
    }
    if (has_lower and has_upper) {
      return DecodeError::MIXED_CASE;
    }

    auto pos = address.rfind(kSeparator);
    if (pos == std::string_view::npos or pos == 0) {
      return DecodeError::MISSING_SEPARATOR;
    }
    if (address.size() > kMaxBech32Length
        or pos + 1 + kChecksumLength > address.size()) {
      return DecodeError::INVALID_LENGTH;
    }

    Bech32Data decoded;
    decoded.prefix.reserve(pos);
    for (auto c : address.substr(0, pos)) {
      decoded.prefix.push_back(isUpper(c) ? static_cast<char>(c - 'A' + 'a')
                                          : c);
    }

    Bytes values;
    values.reserve(address.size() - pos - 1);
    for (auto c : address.substr(pos + 1)) {
      auto v = kCharsetRev[static_cast<uint8_t>(c)];
      if (v < 0) {
        return DecodeError::INVALID_CHARACTER;
      }
      values.push_back(static_cast<uint8_t>(v));
    }

    if (not verifyChecksum(decoded.prefix, values)) {
      return DecodeError::INVALID_CHECKSUM;
    }

    values.resize(values.size() - kChecksumLength);
    decoded.data = std::move(values);
    return decoded;
  }

  outcome::result<Bytes> convertBits(BytesIn data,
                                     unsigned from_bits,
                                     unsigned to_bits,
                                     bool pad) {
    if (from_bits == 0 or from_bits > 8 or to_bits == 0 or to_bits > 8) {
      return BitConversionError::UNSUPPORTED_WIDTH;
    }

    const uint32_t max_value = (1u << to_bits) - 1;
    uint32_t acc = 0;
    unsigned bits = 0;
    Bytes result;
    result.reserve((data.size() * from_bits + to_bits - 1) / to_bits);

    for (auto v : data) {
      if ((v >> from_bits) != 0) {
        return BitConversionError::INVALID_INPUT_VALUE;
      }
      acc = (acc << from_bits) | v;
      bits += from_bits;
      while (bits >= to_bits) {
        bits -= to_bits;
        result.push_back((acc >> bits) & max_value);
      }
    }

    if (pad) {
      if (bits > 0) {
        result.push_back((acc << (to_bits - bits)) & max_value);
      }
    } else if (bits >= from_bits or ((acc << (to_bits - bits)) & max_value)) {
      return BitConversionError::INVALID_PADDING;
    }
    return result;
  }

}  // namespace injaddr::codec
