/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <injaddr/address/address_error.hpp>

namespace injaddr::address {

  /// Minimal number of characters after the separator for detection
  constexpr size_t kMinBech32DataLength = 38;

  /// Length of "0x" + 40 hex digits
  constexpr size_t kEvmAddressLength = 42;

  /// Source of an address as reported to callers
  enum class SourceType { EVM, INJECTIVE, COSMOS };

  /// "evm", "injective" or "cosmos"
  std::string_view toString(SourceType type);

  /// 0x followed by 40 hex digits
  struct EvmFormat {
    bool operator==(const EvmFormat &) const = default;
  };

  /// Lowercase letters prefix, separator, lowercase alphanumeric tail
  struct Bech32Format {
    std::string prefix;

    bool operator==(const Bech32Format &) const = default;
  };

  using AddressFormat = std::variant<EvmFormat, Bech32Format>;

  /// Detected source type and the bech32 prefix of non-EVM addresses
  struct DetectedAddress {
    SourceType source_type;
    std::optional<std::string> chain_prefix;

    bool operator==(const DetectedAddress &) const = default;
  };

  /// Matches ^0x[0-9a-fA-F]{40}$
  bool isEvmAddress(std::string_view address);

  /**
   * Check if a prefix can head an address recognised by
   * detectAddressFormat(), i.e. matches ^[a-z]+$
   * @param prefix to be checked
   */
  bool isChainPrefix(std::string_view prefix);

  /**
   * Classify an address by its shape only, no checksum is verified.
   * EVM shape is tested first, then ^[a-z]+1[a-z0-9]{38,}$ split at the first
   * separator
   * @param address to be classified
   * @return format of the address, UNRECOGNIZED_FORMAT otherwise
   */
  AddressResult<AddressFormat> detectAddressFormat(std::string_view address);

  /**
   * Map a format to the caller-facing source type
   * @param format of an address
   * @param target_prefix - prefix reserved for the target chain
   */
  DetectedAddress toDetectedAddress(const AddressFormat &format,
                                    std::string_view target_prefix);

}  // namespace injaddr::address

template <>
struct fmt::formatter<injaddr::address::SourceType>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(injaddr::address::SourceType type, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(
        injaddr::address::toString(type), ctx);
  }
};
