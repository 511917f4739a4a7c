/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/buffer_view.hpp"
#include "crypto/hasher.hpp"
#include "outcome/outcome.hpp"

namespace foxchain::checksum {

  enum class Eip55Error { INVALID_LENGTH = 1, NON_HEX_INPUT, CHECKSUM_MISMATCH };

  enum class Eip55Status {
    /// mixed case matching the checksum
    CHECKSUMMED,
    /// single case (or no letters at all), carries no checksum
    UNCHECKSUMMED,
  };

  inline constexpr size_t kEvmAddressLength = 20;

  /**
   * @param address 20 bytes of EVM address
   * @return "0x" followed by mixed case hex digits: a letter is uppercase when
   * the matching nibble of Keccak256(lowercase hex) is 8 or more
   */
  std::string toEip55(common::BufferView address, const crypto::Hasher &hasher);

  /**
   * Validate case of 40 hex digits (without "0x")
   */
  outcome::result<Eip55Status> validateEip55(std::string_view hex_digits,
                                             const crypto::Hasher &hasher);

}  // namespace foxchain::checksum

OUTCOME_HPP_DECLARE_ERROR(foxchain::checksum, Eip55Error);
