/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <injaddr/address/address_converter_impl.hpp>

#include <injaddr/codec/bech32.hpp>
#include <injaddr/common/literals.hpp>

#include <gtest/gtest.h>
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace injaddr;
using namespace injaddr::address;
using injaddr::common::operator""_address;

class AddressConverterTest : public ::testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  const std::string kEvm = "0xAF79152AC5dF276D9A8e1E2E22822f9713474902";
  const std::string kEvmLower = "0xaf79152ac5df276d9a8e1e2e22822f9713474902";
  const std::string kInj = "inj14au322k9munkmx5wrchz9q30juf5wjgz2cfqku";
  const std::string kCosmos = "cosmos14au322k9munkmx5wrchz9q30juf5wjgzq37yyy";
  const std::string kOsmo = "osmo14au322k9munkmx5wrchz9q30juf5wjgzg2d5jk";
  const std::string kTerra = "terra14au322k9munkmx5wrchz9q30juf5wjgzx4yyxy";

  AddressConverterImpl converter_;
};

/**
 * @given mixed-case EVM address
 * @when converting it with auto-detection
 * @then target address and lowercase EVM address are produced
 */
TEST_F(AddressConverterTest, ConvertEvmAddress) {
  EXPECT_OUTCOME_TRUE(result, converter_.convertAddress(kEvm));
  ASSERT_EQ(result.input, kEvm);
  ASSERT_EQ(result.injective_address, kInj);
  ASSERT_EQ(result.evm_address, kEvmLower);
  ASSERT_EQ(result.source_type, SourceType::EVM);
  ASSERT_EQ(result.source_chain_prefix, std::nullopt);
}

/**
 * @given target address
 * @when converting it with auto-detection
 * @then it is kept and the EVM address is derived from it
 */
TEST_F(AddressConverterTest, ConvertTargetAddress) {
  EXPECT_OUTCOME_TRUE(result, converter_.convertAddress(kInj));
  ASSERT_EQ(result.injective_address, kInj);
  ASSERT_EQ(result.evm_address, kEvmLower);
  ASSERT_EQ(result.source_type, SourceType::INJECTIVE);
  ASSERT_EQ(result.source_chain_prefix, "inj");
}

/**
 * @given foreign bech32 address
 * @when converting it with auto-detection
 * @then it is re-encoded with the target prefix and its prefix is reported
 */
TEST_F(AddressConverterTest, ConvertForeignAddress) {
  EXPECT_OUTCOME_TRUE(result, converter_.convertAddress(kCosmos));
  ASSERT_EQ(result.injective_address, kInj);
  ASSERT_EQ(result.evm_address, kEvmLower);
  ASSERT_EQ(result.source_type, SourceType::COSMOS);
  ASSERT_EQ(result.source_chain_prefix, "cosmos");
}

/**
 * @given the same account under different prefixes and as EVM hex
 * @when converting each of them
 * @then all of them resolve to the same pair of addresses
 */
TEST_F(AddressConverterTest, SameAccountAcrossPrefixes) {
  for (const auto &address : {kEvm, kEvmLower, kInj, kCosmos, kOsmo, kTerra}) {
    EXPECT_OUTCOME_TRUE(result, converter_.convertAddress(address));
    EXPECT_EQ(result.injective_address, kInj) << address;
    EXPECT_EQ(result.evm_address, kEvmLower) << address;
  }
}

/**
 * @given an input converted twice
 * @when comparing results
 * @then they are equal
 */
TEST_F(AddressConverterTest, ConversionIsDeterministic) {
  EXPECT_OUTCOME_TRUE(first, converter_.convertAddress(kOsmo));
  EXPECT_OUTCOME_TRUE(second, converter_.convertAddress(kOsmo));
  ASSERT_EQ(first, second);
}

/**
 * @given garbage input
 * @when converting it
 * @then UNRECOGNIZED_FORMAT names the input
 */
TEST_F(AddressConverterTest, UnrecognizedInput) {
  auto result = converter_.convertAddress("not_an_address");
  ASSERT_TRUE(result.has_error());
  ASSERT_EQ(result.error().code, AddressError::UNRECOGNIZED_FORMAT);
  ASSERT_EQ(result.error().input, "not_an_address");
  ASSERT_NE(result.error().message().find("not_an_address"),
            std::string::npos);
}

/**
 * @given target address with a broken checksum
 * @when converting it
 * @then INVALID_BECH32_CHECKSUM is returned with the codec error as cause
 */
TEST_F(AddressConverterTest, BadChecksum) {
  auto result =
      converter_.convertAddress("inj14au322k9munkmx5wrchz9q30juf5wjgz2cfqkv");
  ASSERT_TRUE(result.has_error());
  ASSERT_EQ(result.error().code, AddressError::INVALID_BECH32_CHECKSUM);
  ASSERT_EQ(result.error().cause, codec::DecodeError::INVALID_CHECKSUM);
}

/**
 * @given bech32-shaped address whose data part holds a non-charset character
 * @when converting it
 * @then INVALID_BECH32_CHARSET is returned
 */
TEST_F(AddressConverterTest, BadCharset) {
  // 'b' is not part of the bech32 alphabet
  EXPECT_EC(
      converter_.convertAddress("inj14au322k9munkmx5wrchz9q30juf5wjgz2cfqkb"),
      AddressError::INVALID_BECH32_CHARSET);
}

/**
 * @given valid bech32 addresses holding 21 bytes and 33 groups
 * @when converting them
 * @then INVALID_ADDRESS_LENGTH and INVALID_PAYLOAD are returned
 */
TEST_F(AddressConverterTest, WrongPayload) {
  auto too_long = converter_.convertAddress(
      "inj1qqqsyqcyq5rqwzqfpg9scrgwpugpzysnzstrz5g2");
  ASSERT_TRUE(too_long.has_error());
  ASSERT_EQ(too_long.error().code, AddressError::INVALID_ADDRESS_LENGTH);
  ASSERT_EQ(too_long.error().expected, "20");
  ASSERT_EQ(too_long.error().actual, "21");

  EXPECT_EC(
      converter_.convertAddress("inj14au322k9munkmx5wrchz9q30juf5wjgzpgw3vdr"),
      AddressError::INVALID_PAYLOAD);
}

/**
 * @given EVM and target addresses
 * @when converting them in the fixed directions
 * @then each direction is the inverse of the other
 */
TEST_F(AddressConverterTest, DirectionalRoundTrip) {
  EXPECT_OUTCOME_TRUE(inj, converter_.evmToTarget(kEvm));
  ASSERT_EQ(inj, kInj);
  EXPECT_OUTCOME_TRUE(evm, converter_.targetToEvm(inj));
  ASSERT_EQ(evm, kEvmLower);

  EXPECT_OUTCOME_TRUE(zero,
                      converter_.evmToTarget(
                          "0x0000000000000000000000000000000000000000"));
  ASSERT_EQ(zero, "inj1qqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqqe2hm49");
  EXPECT_OUTCOME_TRUE(ones,
                      converter_.evmToTarget(
                          "0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFF"));
  ASSERT_EQ(ones, "inj1llllllllllllllllllllllllllllllll4mk5j0");
}

/**
 * @given malformed hex addresses
 * @when converting them to target addresses
 * @then INVALID_EVM_ADDRESS is returned
 */
TEST_F(AddressConverterTest, InvalidEvm) {
  EXPECT_EC(converter_.evmToTarget("0xINVALID"),
            AddressError::INVALID_EVM_ADDRESS);
  EXPECT_EC(converter_.evmToTarget("AF79152AC5dF276D9A8e1E2E22822f9713474902"),
            AddressError::INVALID_EVM_ADDRESS);
  EXPECT_EC(converter_.evmToTarget(kInj), AddressError::INVALID_EVM_ADDRESS);
  EXPECT_EC(converter_.convertFromEvm("0x1234"),
            AddressError::INVALID_EVM_ADDRESS);
}

/**
 * @given uppercase target address
 * @when converting it with the fixed direction
 * @then it is accepted
 */
TEST_F(AddressConverterTest, UppercaseTarget) {
  EXPECT_OUTCOME_TRUE(
      evm, converter_.targetToEvm("INJ14AU322K9MUNKMX5WRCHZ9Q30JUF5WJGZ2CFQKU"));
  ASSERT_EQ(evm, kEvmLower);
}

/**
 * @given foreign address
 * @when converting it as if it were a target address
 * @then PREFIX_MISMATCH tells the expected and the actual prefixes
 */
TEST_F(AddressConverterTest, PrefixMismatch) {
  auto result = converter_.targetToEvm(kCosmos);
  ASSERT_TRUE(result.has_error());
  ASSERT_EQ(result.error().code, AddressError::PREFIX_MISMATCH);
  ASSERT_EQ(result.error().expected, "inj");
  ASSERT_EQ(result.error().actual, "cosmos");

  EXPECT_EC(converter_.convertFromTarget(kOsmo), AddressError::PREFIX_MISMATCH);
  EXPECT_EC(converter_.targetToForeign(kTerra, "cosmos"),
            AddressError::PREFIX_MISMATCH);
}

/**
 * @given foreign addresses of several chains
 * @when re-encoding them with the target prefix and back
 * @then the original addresses are restored
 */
TEST_F(AddressConverterTest, ForeignRoundTrip) {
  for (const auto &[address, prefix] :
       std::vector<std::pair<std::string, std::string>>{
           {kCosmos, "cosmos"}, {kOsmo, "osmo"}, {kTerra, "terra"}}) {
    EXPECT_OUTCOME_TRUE(inj, converter_.foreignToTarget(address));
    EXPECT_EQ(inj, kInj);
    EXPECT_OUTCOME_TRUE(foreign, converter_.targetToForeign(inj, prefix));
    EXPECT_EQ(foreign, address);
  }
}

/**
 * @given target address and an unusable foreign prefix
 * @when re-encoding
 * @then INVALID_PREFIX names the prefix
 */
TEST_F(AddressConverterTest, InvalidForeignPrefix) {
  // prefixes detection would not split the address at
  for (std::string prefix :
       {"", "Cosmos", "cos mos", "cosmos1x", "osmo!", "osmo2"}) {
    auto result = converter_.targetToForeign(kInj, prefix);
    ASSERT_TRUE(result.has_error());
    EXPECT_EQ(result.error().code, AddressError::INVALID_PREFIX);
    EXPECT_EQ(result.error().input, prefix);
  }
  // too long for a 90 characters address
  EXPECT_EC(converter_.targetToForeign(kInj, std::string(52, 'a')),
            AddressError::INVALID_PREFIX);
}

/**
 * @given foreign address holding 19 bytes
 * @when re-encoding it with the target prefix
 * @then INVALID_ADDRESS_LENGTH is returned
 */
TEST_F(AddressConverterTest, ForeignWrongLength) {
  EXPECT_EC(converter_.foreignToTarget(
                "cosmos1qqqsyqcyq5rqwzqfpg9scrgwpugpzysuumzx0"),
            AddressError::INVALID_ADDRESS_LENGTH);
}

/**
 * @given input asserted to be of a single kind
 * @when converting with the directional helpers
 * @then results equal auto-detected ones
 */
TEST_F(AddressConverterTest, DirectionalHelpers) {
  EXPECT_OUTCOME_TRUE(from_evm, converter_.convertFromEvm(kEvm));
  EXPECT_OUTCOME_TRUE(detected_evm, converter_.convertAddress(kEvm));
  ASSERT_EQ(from_evm, detected_evm);

  EXPECT_OUTCOME_TRUE(from_inj, converter_.convertFromTarget(kInj));
  EXPECT_OUTCOME_TRUE(detected_inj, converter_.convertAddress(kInj));
  ASSERT_EQ(from_inj, detected_inj);
}

/**
 * @given addresses of every kind
 * @when detecting their types
 * @then the target prefix decides between injective and cosmos
 */
TEST_F(AddressConverterTest, DetectAddressType) {
  EXPECT_OUTCOME_TRUE(evm, converter_.detectAddressType(kEvm));
  ASSERT_EQ(evm.source_type, SourceType::EVM);
  EXPECT_OUTCOME_TRUE(inj, converter_.detectAddressType(kInj));
  ASSERT_EQ(inj.source_type, SourceType::INJECTIVE);
  EXPECT_OUTCOME_TRUE(osmo, converter_.detectAddressType(kOsmo));
  ASSERT_EQ(osmo.source_type, SourceType::COSMOS);
  ASSERT_EQ(osmo.chain_prefix, "osmo");
  EXPECT_EC(converter_.detectAddressType("0xINVALID"),
            AddressError::UNRECOGNIZED_FORMAT);
}

/**
 * @given converter configured with "cosmos" as the target prefix
 * @when converting addresses
 * @then cosmos addresses are targets and inj addresses are foreign
 */
TEST_F(AddressConverterTest, CustomTargetPrefix) {
  AddressConverterImpl converter{ConverterConfig{.target_prefix = "cosmos"}};
  ASSERT_EQ(converter.targetPrefix(), "cosmos");

  EXPECT_OUTCOME_TRUE(target, converter.evmToTarget(kEvm));
  ASSERT_EQ(target, kCosmos);

  EXPECT_OUTCOME_TRUE(result, converter.convertAddress(kInj));
  ASSERT_EQ(result.injective_address, kCosmos);
  ASSERT_EQ(result.source_type, SourceType::COSMOS);
  ASSERT_EQ(result.source_chain_prefix, "inj");
}

/**
 * @given the account with bytes 01..14
 * @when converting it from foreign to target
 * @then the reference encoding is produced
 */
TEST_F(AddressConverterTest, SequentialBytes) {
  EXPECT_OUTCOME_TRUE(
      inj,
      converter_.foreignToTarget(
          "cosmos1qypqxpq9qcrsszg2pvxq6rs0zqg3yyc5lzv7xu"));
  ASSERT_EQ(inj, "inj1qypqxpq9qcrsszg2pvxq6rs0zqg3yyc54tm65y");
  EXPECT_OUTCOME_TRUE(evm, converter_.targetToEvm(inj));
  ASSERT_EQ(evm, "0x0102030405060708090a0b0c0d0e0f1011121314");
}

/**
 * @given target address and a long foreign prefix
 * @when re-encoding it with that prefix and converting the result back
 * with auto-detection
 * @then the foreign address is recognised and resolves to the same account
 */
TEST_F(AddressConverterTest, ForeignOutputIsConvertible) {
  EXPECT_OUTCOME_TRUE(foreign,
                      converter_.targetToForeign(kInj, "cosmosvaloper"));
  EXPECT_OUTCOME_TRUE(result, converter_.convertAddress(foreign));
  ASSERT_EQ(result.injective_address, kInj);
  ASSERT_EQ(result.evm_address, kEvmLower);
  ASSERT_EQ(result.source_type, SourceType::COSMOS);
  ASSERT_EQ(result.source_chain_prefix, "cosmosvaloper");
}

/**
 * @given foreign bech32 address whose prefix holds the separator character
 * @when converting it with auto-detection
 * @then it is decoded without a prefix constraint and the decoded prefix is
 * reported
 */
TEST_F(AddressConverterTest, ForeignPrefixWithSeparator) {
  EXPECT_OUTCOME_TRUE(
      address,
      codec::encodeBytes("cosmos1x",
                         "af79152ac5df276d9a8e1e2e22822f9713474902"_address));
  EXPECT_OUTCOME_TRUE(result, converter_.convertAddress(address));
  ASSERT_EQ(result.injective_address, kInj);
  ASSERT_EQ(result.source_type, SourceType::COSMOS);
  ASSERT_EQ(result.source_chain_prefix, "cosmos1x");

  EXPECT_OUTCOME_TRUE(inj, converter_.foreignToTarget(address));
  ASSERT_EQ(inj, kInj);
}

/**
 * @given converter error
 * @when asking for its category name
 * @then the qualified enum name is returned
 */
TEST_F(AddressConverterTest, ErrorCategoryName) {
  EXPECT_STREQ(make_error_code(AddressError::PREFIX_MISMATCH).category().name(),
               "injaddr::address::AddressError");
}
