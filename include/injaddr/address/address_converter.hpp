/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <span>
#include <string>
#include <string_view>

#include <injaddr/address/address_error.hpp>
#include <injaddr/address/address_format.hpp>
#include <injaddr/address/conversion_result.hpp>

namespace injaddr::address {
  /**
   * Re-encodes a 20-byte account identifier between EVM hex and bech32
   * representations. The bech32 prefix of the target chain is called
   * "target prefix", any other bech32 prefix is "foreign"
   */
  class AddressConverter {
   public:
    virtual ~AddressConverter() = default;

    /// Prefix the converter encodes target addresses with
    virtual const std::string &targetPrefix() const = 0;

    /**
     * Detect the source of an address by its shape
     * @param address to be examined
     * @return evm without prefix, injective or cosmos with the bech32 prefix;
     * UNRECOGNIZED_FORMAT otherwise
     */
    virtual AddressResult<DetectedAddress> detectAddressType(
        std::string_view address) const = 0;

    /**
     * Convert 0x-prefixed hex address of any case to a target bech32 address
     * @param hex_address to be converted
     * @return target address, INVALID_EVM_ADDRESS if pattern does not match
     */
    virtual AddressResult<std::string> evmToTarget(
        std::string_view hex_address) const = 0;

    /**
     * Convert a target bech32 address to lowercase 0x-prefixed hex
     * @param bech32_address with the target prefix
     * @return EVM address, PREFIX_MISMATCH for a foreign prefix
     */
    virtual AddressResult<std::string> targetToEvm(
        std::string_view bech32_address) const = 0;

    /**
     * Re-encode a bech32 address of any prefix with the target prefix
     * @param bech32_address to be converted
     * @return target address
     */
    virtual AddressResult<std::string> foreignToTarget(
        std::string_view bech32_address) const = 0;

    /**
     * Re-encode a target address with a foreign prefix
     * @param target_address with the target prefix
     * @param foreign_prefix to encode with
     * @return foreign address, INVALID_PREFIX if prefix can't be used
     */
    virtual AddressResult<std::string> targetToForeign(
        std::string_view target_address,
        std::string_view foreign_prefix) const = 0;

    /**
     * Auto-detect the format of an address and produce both of its
     * representations
     * @param address - EVM, target or foreign bech32 address
     * @return conversion result
     */
    virtual AddressResult<ConversionResult> convertAddress(
        std::string_view address) const = 0;

    /**
     * Same as convertAddress() for an input asserted to be EVM hex
     */
    virtual AddressResult<ConversionResult> convertFromEvm(
        std::string_view hex_address) const = 0;

    /**
     * Same as convertAddress() for an input asserted to carry the target
     * prefix
     */
    virtual AddressResult<ConversionResult> convertFromTarget(
        std::string_view bech32_address) const = 0;

    /**
     * Convert each address independently; a failing entry never aborts the
     * batch
     * @param addresses - non-empty list, bounded by the configured size
     * @return report of conversions and failures, EMPTY_BATCH or
     * BATCH_TOO_LARGE for the whole batch
     */
    virtual AddressResult<BatchReport> convertBatch(
        std::span<const std::string> addresses) const = 0;
  };

}  // namespace injaddr::address
