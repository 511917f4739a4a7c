/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "registry/encoding_family.hpp"

namespace foxchain::input {

  /**
   * Structural facts about raw input, collected without choosing a chain.
   * A family is listed whenever the input may belong to it.
   */
  struct InputSignature {
    /// input with surrounding whitespace removed
    std::string input;
    std::set<registry::EncodingFamily> families;
    bool has_0x_prefix = false;
    /// count of bytes the hex digits decode to
    std::optional<size_t> hex_length;
    /// count of bytes the Base58 string decodes to
    std::optional<size_t> base58_length;
    /// lowercase human-readable part of Bech32-like input
    std::optional<std::string> bech32_hrp;

    bool contains(registry::EncodingFamily family) const {
      return families.contains(family);
    }

    /// hex digits without "0x"
    std::string_view hexDigits() const {
      std::string_view view = input;
      if (has_0x_prefix) {
        view.remove_prefix(2);
      }
      return view;
    }
  };

}  // namespace foxchain::input
