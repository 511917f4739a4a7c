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

  enum class Bech32Error {
    MIXED_CASE = 1,
    MISSING_SEPARATOR,
    INVALID_HRP,
    INVALID_CHARACTER,
    TOO_SHORT,
    TOO_LONG,
  };

  enum class ConvertBitsError {
    INVALID_BIT_WIDTH = 1,
    VALUE_OUT_OF_RANGE,
    NON_ZERO_PADDING,
    EXCESS_PADDING,
  };

  inline constexpr std::string_view kBech32Charset =
      "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

  /// Limit of BIP-173 strings
  inline constexpr size_t kBech32MaxLength = 90;

  /// Limit used by chains which encode long payloads (Cardano)
  inline constexpr size_t kBech32ExtendedMaxLength = 1023;

  inline constexpr size_t kBech32ChecksumLength = 6;

  inline constexpr char kBech32Separator = '1';

  /**
   * Bech32 string split into its human-readable part and 5-bit values.
   * Values still include the trailing checksum.
   */
  struct Bech32Parts {
    std::string hrp;
    common::Buffer values;
  };

  /**
   * @return true if {@param c} belongs to the data charset, either case
   */
  bool isBech32Char(char c);

  /**
   * Split string into lowercase HRP and 5-bit values, without checksum
   * verification
   * @param str source string
   * @param max_length maximal accepted length of the whole string
   */
  outcome::result<Bech32Parts> splitBech32(std::string_view str,
                                           size_t max_length = kBech32MaxLength);

  /**
   * Joins {@param hrp} and 5-bit {@param values} into lowercase string
   */
  std::string joinBech32(std::string_view hrp, common::BufferView values);

  /**
   * Regroup bits of {@param data} from {@param from_bits}-wide values into
   * {@param to_bits}-wide values
   * @param pad when true, incomplete trailing group is zero-padded; when
   * false, leftover bits must be fewer than {@param from_bits} and all zero
   */
  outcome::result<common::Buffer> convertBits(common::BufferView data,
                                              unsigned from_bits,
                                              unsigned to_bits,
                                              bool pad);

}  // namespace foxchain::encoding

OUTCOME_HPP_DECLARE_ERROR(foxchain::encoding, Bech32Error);
OUTCOME_HPP_DECLARE_ERROR(foxchain::encoding, ConvertBitsError);
