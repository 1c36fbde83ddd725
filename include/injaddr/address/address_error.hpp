/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <system_error>

#include <injaddr/outcome/outcome.hpp>

namespace injaddr::address {

  enum class AddressError {
    INVALID_EVM_ADDRESS = 1,
    UNRECOGNIZED_FORMAT,
    INVALID_BECH32_CHECKSUM,
    INVALID_BECH32_CHARSET,
    MALFORMED_BECH32,
    PREFIX_MISMATCH,
    INVALID_ADDRESS_LENGTH,
    INVALID_PAYLOAD,
    INVALID_PREFIX,
    BATCH_TOO_LARGE,
    EMPTY_BATCH
  };

  /**
   * Classified conversion failure together with the offending input.
   * Usable as an outcome error type: the error code is found by
   * make_error_code() through ADL.
   */
  struct ConversionFailure {
    /// one of AddressError
    std::error_code code;

    /// value rejected by the converter
    std::string input;

    /// codec error behind the failure, if any
    std::error_code cause{};

    /// expected vs actual value, e.g. bech32 prefixes or payload length
    std::optional<std::string> expected{};
    std::optional<std::string> actual{};

    /// Human-readable description including all of the details above
    std::string message() const;
  };

  inline const std::error_code &make_error_code(
      const ConversionFailure &failure) {
    return failure.code;
  }

  [[noreturn]] inline void outcome_throw_as_system_error_with_payload(
      const ConversionFailure &failure) {
    throw std::system_error(failure.code, failure.message());
  }

  template <typename T>
  using AddressResult = outcome::result<T, ConversionFailure>;

}  // namespace injaddr::address

OUTCOME_HPP_DECLARE_ERROR(injaddr::address, AddressError);

template <>
struct fmt::formatter<injaddr::address::ConversionFailure>
    : fmt::formatter<std::string_view> {
  template <typename FormatContext>
  auto format(const injaddr::address::ConversionFailure &failure,
              FormatContext &ctx) const -> decltype(ctx.out()) {
    return fmt::formatter<std::string_view>::format(failure.message(), ctx);
  }
};
