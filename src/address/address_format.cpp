/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <injaddr/address/address_format.hpp>

#include <algorithm>
#include <iterator>
#include <type_traits>

namespace {
  constexpr bool isHexDigit(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')
        || (c >= 'A' && c <= 'F');
  }

  constexpr bool isLowerAlpha(char c) noexcept {
    return c >= 'a' && c <= 'z';
  }

  constexpr bool isLowerAlnum(char c) noexcept {
    return isLowerAlpha(c) || (c >= '0' && c <= '9');
  }
}  // namespace

namespace injaddr::address {

  std::string_view toString(SourceType type) {
    switch (type) {
      case SourceType::EVM:
        return "evm";
      case SourceType::INJECTIVE:
        return "injective";
      case SourceType::COSMOS:
        return "cosmos";
    }
    return "unknown";
  }

  bool isEvmAddress(std::string_view address) {
    return address.size() == kEvmAddressLength and address[0] == '0'
       and address[1] == 'x'
       and std::all_of(address.begin() + 2, address.end(), isHexDigit);
  }

  bool isChainPrefix(std::string_view prefix) {
    return not prefix.empty()
       and std::all_of(prefix.begin(), prefix.end(), isLowerAlpha);
  }

  AddressResult<AddressFormat> detectAddressFormat(std::string_view address) {
    if (isEvmAddress(address)) {
      return AddressFormat{EvmFormat{}};
    }

    auto prefix_end = std::find_if_not(address.begin(), address.end(),
                                       isLowerAlpha);
    auto prefix_size =
        static_cast<size_t>(std::distance(address.begin(), prefix_end));
    if (prefix_size > 0 and prefix_size < address.size()
        and address[prefix_size] == '1') {
      auto tail = address.substr(prefix_size + 1);
      if (tail.size() >= kMinBech32DataLength
          and std::all_of(tail.begin(), tail.end(), isLowerAlnum)) {
        return AddressFormat{
            Bech32Format{std::string{address.substr(0, prefix_size)}}};
      }
    }

    return ConversionFailure{
        .code = make_error_code(AddressError::UNRECOGNIZED_FORMAT),
        .input = std::string{address},
    };
  }

  DetectedAddress toDetectedAddress(const AddressFormat &format,
                                    std::string_view target_prefix) {
    return std::visit(
        [&](const auto &f) -> DetectedAddress {
          using T = std::decay_t<decltype(f)>;
          if constexpr (std::is_same_v<T, EvmFormat>) {
            return {SourceType::EVM, std::nullopt};
          } else {
            return {f.prefix == target_prefix ? SourceType::INJECTIVE
                                              : SourceType::COSMOS,
                    f.prefix};
          }
        },
        format);
  }

}  // namespace injaddr::address
