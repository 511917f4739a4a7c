/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>

#include "common/buffer.hpp"
#include "encoding/bech32.hpp"
#include "outcome/outcome.hpp"

namespace foxchain::checksum {

  enum class Bech32ChecksumError { INVALID_CHECKSUM = 1 };

  /**
   * Bech32 (BIP-173) and Bech32m (BIP-350) differ only in the final
   * checksum constant
   */
  enum class Bech32Variant { BECH32, BECH32M };

  struct Bech32Decoded {
    /// lowercase human-readable part
    std::string hrp;
    /// 5-bit values without checksum
    common::Buffer data;
    Bech32Variant variant;
  };

  /**
   * Checks checksum of {@param hrp} with 5-bit {@param values} (checksum
   * included)
   * @return variant whose constant the checksum matches
   */
  std::optional<Bech32Variant> verifyBech32Checksum(std::string_view hrp,
                                                    common::BufferView values);

  /**
   * @return lowercase string of {@param hrp}, 5-bit {@param data} and checksum
   */
  std::string encodeBech32(std::string_view hrp,
                           common::BufferView data,
                           Bech32Variant variant = Bech32Variant::BECH32);

  /**
   * Split and verify Bech32 or Bech32m string
   */
  outcome::result<Bech32Decoded> decodeBech32(
      std::string_view str, size_t max_length = encoding::kBech32MaxLength);

}  // namespace foxchain::checksum

OUTCOME_HPP_DECLARE_ERROR(foxchain::checksum, Bech32ChecksumError);
