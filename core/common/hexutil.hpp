/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"

namespace foxchain::common {

  class BufferView;

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    NOT_ENOUGH_INPUT = 1,
    NON_HEX_INPUT,
  };
}  // namespace foxchain::common

OUTCOME_HPP_DECLARE_ERROR(foxchain::common, UnhexError);

namespace foxchain::common {
  /**
   * @brief Converts bytes to hex representation
   * @param bytes source bytes
   * @return lowercase hexstring
   */
  std::string hex_lower(BufferView bytes);

  /**
   * @brief Converts bytes to hex representation with prefix 0x
   * @param bytes source bytes
   * @return lowercase hexstring
   */
  std::string hex_lower_0x(BufferView bytes);

  /**
   * @return true if every character of {@param str} is a hex digit of either
   * case
   */
  bool isHexDigits(std::string_view str);

  /**
   * @brief Converts hex representation to bytes
   * @param hex individual chars
   * @return result containing array of bytes if input string is hex encoded and
   * has even length
   *
   * @note reads both uppercase and lowercase hexstrings
   */
  outcome::result<std::vector<uint8_t>> unhex(std::string_view hex);

}  // namespace foxchain::common
