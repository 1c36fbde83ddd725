/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <injaddr/address/address_error.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(injaddr::address, AddressError, e) {
  using E = injaddr::address::AddressError;
  switch (e) {
    case E::INVALID_EVM_ADDRESS:
      return "Invalid EVM address, must be 0x followed by 40 hex characters";
    case E::UNRECOGNIZED_FORMAT:
      return "Unrecognised address format, expected a 0x hex address or a "
             "bech32 address";
    case E::INVALID_BECH32_CHECKSUM:
      return "Invalid bech32 checksum";
    case E::INVALID_BECH32_CHARSET:
      return "Invalid bech32 characters";
    case E::MALFORMED_BECH32:
      return "Malformed bech32 address";
    case E::PREFIX_MISMATCH:
      return "Unexpected bech32 prefix";
    case E::INVALID_ADDRESS_LENGTH:
      return "Invalid address length in bytes";
    case E::INVALID_PAYLOAD:
      return "Bech32 payload cannot be regrouped into bytes";
    case E::INVALID_PREFIX:
      return "Invalid bech32 prefix";
    case E::BATCH_TOO_LARGE:
      return "Too many addresses in batch";
    case E::EMPTY_BATCH:
      return "Batch contains no addresses";
    default:
      return "Unknown error";
  }
}

namespace injaddr::address {

  std::string ConversionFailure::message() const {
    auto text = input.empty() ? code.message()
                              : fmt::format("{}: '{}'", code.message(), input);
    if (expected and actual) {
      text += fmt::format(" (expected {}, got {})", *expected, *actual);
    }
    if (cause) {
      text += fmt::format(", {}", cause.message());
    }
    return text;
  }

}  // namespace injaddr::address
