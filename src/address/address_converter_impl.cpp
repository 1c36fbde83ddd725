/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <injaddr/address/address_converter_impl.hpp>

#include <algorithm>
#include <type_traits>

#include <injaddr/codec/bech32.hpp>
#include <injaddr/common/hexutil.hpp>

namespace {
  using injaddr::address::AddressError;
  using injaddr::address::ConversionFailure;

  ConversionFailure makeFailure(AddressError error,
                                std::string_view input,
                                std::error_code cause = {}) {
    return ConversionFailure{
        .code = make_error_code(error),
        .input = std::string{input},
        .cause = cause,
    };
  }

  AddressError classifyDecodeError(const std::error_code &ec) {
    using injaddr::codec::DecodeError;
    if (ec == DecodeError::INVALID_CHECKSUM) {
      return AddressError::INVALID_BECH32_CHECKSUM;
    }
    if (ec == DecodeError::INVALID_CHARACTER or ec == DecodeError::MIXED_CASE) {
      return AddressError::INVALID_BECH32_CHARSET;
    }
    return AddressError::MALFORMED_BECH32;
  }
}  // namespace

namespace injaddr::address {

  std::string toEvmHex(const common::AddressBytes &bytes) {
    return "0x" + common::hex_lower(bytes);
  }

  AddressConverterImpl::AddressConverterImpl(ConverterConfig config)
      : config_(std::move(config)),
        log_(log::createLogger("AddressConverter",
                               log::addressGroupName)) {}

  const std::string &AddressConverterImpl::targetPrefix() const {
    return config_.target_prefix;
  }

  AddressResult<DetectedAddress> AddressConverterImpl::detectAddressType(
      std::string_view address) const {
    OUTCOME_TRY(format, detectAddressFormat(address));
    return toDetectedAddress(format, config_.target_prefix);
  }

  AddressResult<std::string> AddressConverterImpl::evmToTarget(
      std::string_view hex_address) const {
    OUTCOME_TRY(bytes, parseEvm(hex_address));
    return encodeBech32(config_.target_prefix, bytes, config_.target_prefix);
  }

  AddressResult<std::string> AddressConverterImpl::targetToEvm(
      std::string_view bech32_address) const {
    OUTCOME_TRY(decoded, decodeBech32(bech32_address, config_.target_prefix));
    return toEvmHex(decoded.bytes);
  }

  AddressResult<std::string> AddressConverterImpl::foreignToTarget(
      std::string_view bech32_address) const {
    OUTCOME_TRY(decoded, decodeBech32(bech32_address, std::nullopt));
    return encodeBech32(
        config_.target_prefix, decoded.bytes, config_.target_prefix);
  }

  AddressResult<std::string> AddressConverterImpl::targetToForeign(
      std::string_view target_address, std::string_view foreign_prefix) const {
    if (not isChainPrefix(foreign_prefix)) {
      return makeFailure(AddressError::INVALID_PREFIX, foreign_prefix);
    }
    OUTCOME_TRY(decoded, decodeBech32(target_address, config_.target_prefix));
    return encodeBech32(foreign_prefix, decoded.bytes, foreign_prefix);
  }

  AddressResult<ConversionResult> AddressConverterImpl::convertAddress(
      std::string_view address) const {
    OUTCOME_TRY(format, detectAddressFormat(address));
    auto detected = toDetectedAddress(format, config_.target_prefix);

    auto bytes = std::visit(
        [&](const auto &f) -> AddressResult<common::AddressBytes> {
          using T = std::decay_t<decltype(f)>;
          if constexpr (std::is_same_v<T, EvmFormat>) {
            return parseEvm(address);
          } else {
            // the codec splits at the last separator, detection at the first
            auto expected_prefix =
                detected.source_type == SourceType::INJECTIVE
                    ? std::optional<std::string_view>{f.prefix}
                    : std::nullopt;
            OUTCOME_TRY(decoded, decodeBech32(address, expected_prefix));
            detected.chain_prefix = std::move(decoded.prefix);
            return decoded.bytes;
          }
        },
        format);
    if (bytes.has_error()) {
      SL_TRACE(log_, "cannot convert {} address: {}", detected.source_type,
               bytes.error());
      return bytes.error();
    }

    return makeResult(address, bytes.value(), std::move(detected));
  }

  AddressResult<ConversionResult> AddressConverterImpl::convertFromEvm(
      std::string_view hex_address) const {
    OUTCOME_TRY(bytes, parseEvm(hex_address));
    return makeResult(hex_address, bytes, {SourceType::EVM, std::nullopt});
  }

  AddressResult<ConversionResult> AddressConverterImpl::convertFromTarget(
      std::string_view bech32_address) const {
    OUTCOME_TRY(decoded, decodeBech32(bech32_address, config_.target_prefix));
    return makeResult(bech32_address,
                      decoded.bytes,
                      {SourceType::INJECTIVE, decoded.prefix});
  }

  AddressResult<BatchReport> AddressConverterImpl::convertBatch(
      std::span<const std::string> addresses) const {
    if (addresses.empty()) {
      return makeFailure(AddressError::EMPTY_BATCH, {});
    }
    if (addresses.size() > config_.max_batch_size) {
      auto failure = makeFailure(AddressError::BATCH_TOO_LARGE, {});
      failure.expected = fmt::format("at most {}", config_.max_batch_size);
      failure.actual = std::to_string(addresses.size());
      return failure;
    }

    BatchReport report;
    for (const auto &address : addresses) {
      auto result = convertAddress(address);
      if (result.has_value()) {
        report.successes.emplace_back(std::move(result.value()));
      } else {
        SL_DEBUG(log_, "batch entry rejected: {}", result.error());
        report.failures.push_back({address, std::move(result.error())});
      }
    }

    SL_DEBUG(log_,
             "batch of {} addresses: {} converted, {} failed",
             addresses.size(),
             report.successes.size(),
             report.failures.size());
    return report;
  }

  AddressResult<common::AddressBytes> AddressConverterImpl::parseEvm(
      std::string_view hex_address) const {
    if (not isEvmAddress(hex_address)) {
      return makeFailure(AddressError::INVALID_EVM_ADDRESS, hex_address);
    }
    auto bytes = common::unhexAddress(hex_address.substr(2));
    if (bytes.has_error()) {
      return makeFailure(
          AddressError::INVALID_EVM_ADDRESS, hex_address, bytes.error());
    }
    return bytes.value();
  }

  AddressResult<AddressConverterImpl::DecodedAddress>
  AddressConverterImpl::decodeBech32(
      std::string_view address,
      std::optional<std::string_view> expected_prefix) const {
    auto decoded = codec::decode(address);
    if (decoded.has_error()) {
      return makeFailure(
          classifyDecodeError(decoded.error()), address, decoded.error());
    }

    auto &prefix = decoded.value().prefix;
    if (expected_prefix and prefix != *expected_prefix) {
      auto failure = makeFailure(AddressError::PREFIX_MISMATCH, address);
      failure.expected = std::string{*expected_prefix};
      failure.actual = prefix;
      return failure;
    }

    auto payload = codec::convertBits(decoded.value().data, 5, 8, false);
    if (payload.has_error()) {
      return makeFailure(
          AddressError::INVALID_PAYLOAD, address, payload.error());
    }
    if (payload.value().size() != common::kAddressLength) {
      auto failure = makeFailure(AddressError::INVALID_ADDRESS_LENGTH, address);
      failure.expected = std::to_string(common::kAddressLength);
      failure.actual = std::to_string(payload.value().size());
      return failure;
    }

    DecodedAddress result{std::move(prefix), {}};
    std::copy(
        payload.value().begin(), payload.value().end(), result.bytes.begin());
    return result;
  }

  AddressResult<std::string> AddressConverterImpl::encodeBech32(
      std::string_view prefix,
      const common::AddressBytes &bytes,
      std::string_view input) const {
    auto encoded = codec::encodeBytes(prefix, bytes);
    if (encoded.has_error()) {
      return makeFailure(AddressError::INVALID_PREFIX, input, encoded.error());
    }
    return std::move(encoded.value());
  }

  AddressResult<ConversionResult> AddressConverterImpl::makeResult(
      std::string_view input,
      const common::AddressBytes &bytes,
      DetectedAddress detected) const {
    OUTCOME_TRY(injective_address,
                encodeBech32(config_.target_prefix, bytes, config_.target_prefix));
    SL_TRACE(log_, "converted {} address {}", detected.source_type, input);
    return ConversionResult{
        .input = std::string{input},
        .injective_address = std::move(injective_address),
        .evm_address = toEvmHex(bytes),
        .source_type = detected.source_type,
        .source_chain_prefix = std::move(detected.chain_prefix),
    };
  }

}  // namespace injaddr::address
