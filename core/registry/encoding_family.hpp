/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace foxchain::registry {

  /**
   * Textual shape of an address. Order matches alternatives of AddressFormat.
   */
  enum class EncodingFamily : uint8_t {
    HEX = 0,
    BASE58CHECK,
    BECH32,
    BASE58,
    SS58,
  };

  inline constexpr std::array kAllEncodingFamilies{
      EncodingFamily::HEX,
      EncodingFamily::BASE58CHECK,
      EncodingFamily::BECH32,
      EncodingFamily::BASE58,
      EncodingFamily::SS58,
  };

  constexpr std::string_view toString(EncodingFamily family) {
    switch (family) {
      case EncodingFamily::HEX:
        return "hex";
      case EncodingFamily::BASE58CHECK:
        return "base58check";
      case EncodingFamily::BECH32:
        return "bech32";
      case EncodingFamily::BASE58:
        return "base58";
      case EncodingFamily::SS58:
        return "ss58";
    }
    return "unknown";
  }

}  // namespace foxchain::registry
