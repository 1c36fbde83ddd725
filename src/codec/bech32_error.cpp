/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <injaddr/codec/bech32_error.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(injaddr::codec, EncodeError, e) {
  using E = injaddr::codec::EncodeError;
  switch (e) {
    case E::EMPTY_PREFIX:
      return "Human-readable prefix is empty";
    case E::INVALID_PREFIX_CHARACTER:
      return "Human-readable prefix contains an invalid character";
    case E::INVALID_DATA_VALUE:
      return "Payload value does not fit into 5 bits";
    case E::TOO_LONG:
      return "Encoded string exceeds 90 characters";
    default:
      return "Unknown error";
  }
}

OUTCOME_CPP_DEFINE_CATEGORY(injaddr::codec, DecodeError, e) {
  using E = injaddr::codec::DecodeError;
  switch (e) {
    case E::INVALID_CHARACTER:
      return "Input contains a character outside the bech32 charset";
    case E::MIXED_CASE:
      return "Input mixes upper and lower case";
    case E::MISSING_SEPARATOR:
      return "Input has no separator or an empty prefix";
    case E::INVALID_LENGTH:
      return "Input length is out of bech32 bounds";
    case E::INVALID_CHECKSUM:
      return "Bech32 checksum verification failed";
    default:
      return "Unknown error";
  }
}

OUTCOME_CPP_DEFINE_CATEGORY(injaddr::codec, BitConversionError, e) {
  using E = injaddr::codec::BitConversionError;
  switch (e) {
    case E::INVALID_INPUT_VALUE:
      return "Input value exceeds the source bit width";
    case E::INVALID_PADDING:
      return "Leftover bits are not a valid zero padding";
    case E::UNSUPPORTED_WIDTH:
      return "Bit width must be between 1 and 8";
    default:
      return "Unknown error";
  }
}
