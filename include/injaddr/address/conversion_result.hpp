/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <injaddr/address/address_error.hpp>
#include <injaddr/address/address_format.hpp>

namespace injaddr::address {

  /**
   * Both representations of one account. injective_address and evm_address
   * always carry the same 20 bytes
   */
  struct ConversionResult {
    std::string input;
    std::string injective_address;
    /// lowercase, 0x-prefixed
    std::string evm_address;
    SourceType source_type;
    /// bech32 prefix of the input, none for EVM input
    std::optional<std::string> source_chain_prefix;

    bool operator==(const ConversionResult &) const = default;
  };

  /// Rejected batch entry
  struct BatchFailure {
    std::string input;
    ConversionFailure error;

    std::string message() const {
      return error.message();
    }
  };

  /**
   * Outcome of a batch conversion. Each entry of the input lands in exactly
   * one of the sequences, in input order
   */
  struct BatchReport {
    std::vector<ConversionResult> successes;
    std::vector<BatchFailure> failures;

    /// Number of converted addresses
    size_t total() const {
      return successes.size();
    }
  };

}  // namespace injaddr::address
