/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <injaddr/outcome/outcome.hpp>

namespace injaddr::codec {

  enum class EncodeError {
    EMPTY_PREFIX = 1,
    INVALID_PREFIX_CHARACTER,
    INVALID_DATA_VALUE,
    TOO_LONG
  };

  enum class DecodeError {
    INVALID_CHARACTER = 1,
    MIXED_CASE,
    MISSING_SEPARATOR,
    INVALID_LENGTH,
    INVALID_CHECKSUM
  };

  enum class BitConversionError {
    INVALID_INPUT_VALUE = 1,
    INVALID_PADDING,
    UNSUPPORTED_WIDTH
  };

}  // namespace injaddr::codec

OUTCOME_HPP_DECLARE_ERROR(injaddr::codec, EncodeError);
OUTCOME_HPP_DECLARE_ERROR(injaddr::codec, DecodeError);
OUTCOME_HPP_DECLARE_ERROR(injaddr::codec, BitConversionError);
