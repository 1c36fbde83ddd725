/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <injaddr/address/address_converter.hpp>
#include <injaddr/address/converter_config.hpp>
#include <injaddr/common/types.hpp>
#include <injaddr/log/logger.hpp>

namespace injaddr::address {

  class AddressConverterImpl : public AddressConverter {
   public:
    /**
     * Logging system must be installed with log::setLoggingSystem() before
     * @throws std::logic_error otherwise
     */
    explicit AddressConverterImpl(ConverterConfig config = {});

    ~AddressConverterImpl() override = default;

    const std::string &targetPrefix() const override;

    AddressResult<DetectedAddress> detectAddressType(
        std::string_view address) const override;

    AddressResult<std::string> evmToTarget(
        std::string_view hex_address) const override;

    AddressResult<std::string> targetToEvm(
        std::string_view bech32_address) const override;

    AddressResult<std::string> foreignToTarget(
        std::string_view bech32_address) const override;

    AddressResult<std::string> targetToForeign(
        std::string_view target_address,
        std::string_view foreign_prefix) const override;

    AddressResult<ConversionResult> convertAddress(
        std::string_view address) const override;

    AddressResult<ConversionResult> convertFromEvm(
        std::string_view hex_address) const override;

    AddressResult<ConversionResult> convertFromTarget(
        std::string_view bech32_address) const override;

    AddressResult<BatchReport> convertBatch(
        std::span<const std::string> addresses) const override;

   private:
    /// Bech32 address decoded down to the canonical bytes
    struct DecodedAddress {
      std::string prefix;
      common::AddressBytes bytes;
    };

    AddressResult<common::AddressBytes> parseEvm(
        std::string_view hex_address) const;

    /**
     * Decode a bech32 address into 20 bytes
     * @param address to be decoded
     * @param expected_prefix - prefix the address must carry, any if none
     */
    AddressResult<DecodedAddress> decodeBech32(
        std::string_view address,
        std::optional<std::string_view> expected_prefix) const;

    AddressResult<std::string> encodeBech32(std::string_view prefix,
                                            const common::AddressBytes &bytes,
                                            std::string_view input) const;

    /// Both encodings derived from the same bytes
    AddressResult<ConversionResult> makeResult(
        std::string_view input,
        const common::AddressBytes &bytes,
        DetectedAddress detected) const;

    ConverterConfig config_;
    log::Logger log_;
  };

  /// Lowercase 0x-prefixed hex of an address
  std::string toEvmHex(const common::AddressBytes &bytes);

}  // namespace injaddr::address
