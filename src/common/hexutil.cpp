/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <injaddr/common/hexutil.hpp>

#include <algorithm>

OUTCOME_CPP_DEFINE_CATEGORY(injaddr::common, UnhexError, e) {
  using injaddr::common::UnhexError;
  switch (e) {
    case UnhexError::NON_HEX_INPUT:
      return "Input contains non-hex characters";
    case UnhexError::NOT_ENOUGH_INPUT:
      return "Input contains wrong number of characters";
    default:
      return "Unknown error";
  }
}

namespace injaddr::common {
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex) {
    std::vector<uint8_t> blob;
    blob.reserve((hex.size() + 1) / 2);

    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(blob));
      return blob;

    } catch (const boost::algorithm::not_enough_input &e) {
      return UnhexError::NOT_ENOUGH_INPUT;

    } catch (const boost::algorithm::non_hex_input &e) {
      return UnhexError::NON_HEX_INPUT;

    } catch (const std::exception &e) {
      return UnhexError::UNKNOWN;
    }
  }

  outcome::result<AddressBytes> unhexAddress(std::string_view hex) {
    if (hex.size() != kAddressLength * 2) {
      return UnhexError::NOT_ENOUGH_INPUT;
    }
    OUTCOME_TRY(blob, unhex(hex));
    AddressBytes address{};
    std::copy(blob.begin(), blob.end(), address.begin());
    return address;
  }
}  // namespace injaddr::common
