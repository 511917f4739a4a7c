/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "encoding/ss58.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(foxchain::encoding, Ss58PrefixError, e) {
  using E = foxchain::encoding::Ss58PrefixError;
  switch (e) {
    case E::PREFIX_OUT_OF_RANGE:
      return "SS58 prefix must not exceed 16383";
    case E::RESERVED_PREFIX:
      return "SS58 prefix byte is in the reserved range";
    case E::NON_CANONICAL_PREFIX:
      return "Two-byte SS58 prefix encodes a value below 64";
    case E::NOT_ENOUGH_DATA:
      return "Not enough data to read SS58 prefix";
  }
  return "Unknown SS58 prefix error";
}

namespace foxchain::encoding {

  namespace {
    constexpr uint8_t kTwoByteMarker = 0b0100'0000;
    constexpr uint8_t kReservedMarker = 0b1000'0000;
  }  // namespace

  outcome::result<common::Buffer> encodeSs58Prefix(uint16_t prefix) {
    if (prefix > kSs58MaxPrefix) {
      return Ss58PrefixError::PREFIX_OUT_OF_RANGE;
    }
    common::Buffer res;
    if (prefix <= kSs58MaxSimplePrefix) {
      res.putUint8(static_cast<uint8_t>(prefix));
    } else {
      res.putUint8(static_cast<uint8_t>(kTwoByteMarker | (prefix >> 8)))
          .putUint8(static_cast<uint8_t>(prefix & 0xff));
    }
    return res;
  }

  outcome::result<Ss58Prefix> decodeSs58Prefix(common::BufferView bytes) {
    if (bytes.empty()) {
      return Ss58PrefixError::NOT_ENOUGH_DATA;
    }
    auto first = bytes[0];
    if ((first & kReservedMarker) != 0) {
      return Ss58PrefixError::RESERVED_PREFIX;
    }
    if ((first & kTwoByteMarker) == 0) {
      return Ss58Prefix{.value = first, .length = 1};
    }
    if (bytes.size() < 2) {
      return Ss58PrefixError::NOT_ENOUGH_DATA;
    }
    auto value =
        static_cast<uint16_t>(((first & 0b0011'1111) << 8) | bytes[1]);
    if (value <= kSs58MaxSimplePrefix) {
      return Ss58PrefixError::NON_CANONICAL_PREFIX;
    }
    return Ss58Prefix{.value = value, .length = 2};
  }

}  // namespace foxchain::encoding
