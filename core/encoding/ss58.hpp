/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/buffer.hpp"
#include "outcome/outcome.hpp"

namespace foxchain::encoding {

  enum class Ss58PrefixError {
    PREFIX_OUT_OF_RANGE = 1,
    RESERVED_PREFIX,
    NON_CANONICAL_PREFIX,
    NOT_ENOUGH_DATA,
  };

  /// Prefixes up to this value use the one-byte form
  inline constexpr uint16_t kSs58MaxSimplePrefix = 63;
  inline constexpr uint16_t kSs58MaxPrefix = 16383;

  /**
   * Network prefix read from the head of SS58 payload
   */
  struct Ss58Prefix {
    uint16_t value;
    /// count of bytes occupied by the prefix, 1 or 2
    size_t length;
  };

  /**
   * Encode network prefix.
   * 0..63 take a single byte; 64..16383 take two bytes where
   * byte0 = 0x40 | (prefix >> 8) and byte1 = prefix & 0xFF
   */
  outcome::result<common::Buffer> encodeSs58Prefix(uint16_t prefix);

  /**
   * Read network prefix from the beginning of {@param bytes}
   */
  outcome::result<Ss58Prefix> decodeSs58Prefix(common::BufferView bytes);

}  // namespace foxchain::encoding

OUTCOME_HPP_DECLARE_ERROR(foxchain::encoding, Ss58PrefixError);
