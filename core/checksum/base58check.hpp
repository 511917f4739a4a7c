/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <string>

#include "common/buffer.hpp"
#include "crypto/hasher.hpp"
#include "outcome/outcome.hpp"

namespace foxchain::checksum {

  enum class Base58CheckError { TOO_SHORT = 1, CHECKSUM_MISMATCH };

  inline constexpr size_t kBase58CheckChecksumLength = 4;

  using Base58Checksum = std::array<uint8_t, kBase58CheckChecksumLength>;

  /**
   * First 4 bytes of SHA256(SHA256(data))
   */
  Base58Checksum computeBase58Checksum(common::BufferView data,
                                       const crypto::Hasher &hasher);

  /**
   * Base58(data || checksum(data))
   * @param data version byte(s) followed by payload
   */
  std::string encodeBase58Check(common::BufferView data,
                                const crypto::Hasher &hasher);

  /**
   * Decode Base58 and verify trailing checksum
   * @return version byte(s) with payload, checksum stripped
   */
  outcome::result<common::Buffer> decodeBase58Check(
      std::string_view str, const crypto::Hasher &hasher);

}  // namespace foxchain::checksum

OUTCOME_HPP_DECLARE_ERROR(foxchain::checksum, Base58CheckError);
