/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace foxchain::encoding {

  enum class Base58Error { INVALID_CHARACTER = 1 };

  /// Bitcoin alphabet: all alphanumeric characters except "0", "I", "O", "l"
  inline constexpr std::string_view kBase58Alphabet =
      "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

  /**
   * @return true if {@param c} belongs to the Base58 alphabet
   */
  bool isBase58Char(char c);

  /**
   * Decode a Base58 string
   * @param str string without surrounding whitespace
   * @return decoded bytes, every leading '1' becomes a leading zero byte
   */
  outcome::result<common::Buffer> decodeBase58(std::string_view str);

  std::string encodeBase58(common::BufferView bytes);

}  // namespace foxchain::encoding

OUTCOME_HPP_DECLARE_ERROR(foxchain::encoding, Base58Error);
