/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>

#include "common/buffer.hpp"
#include "crypto/hasher.hpp"
#include "outcome/outcome.hpp"

namespace foxchain::checksum {

  enum class Ss58Error {
    INVALID_LENGTH = 1,
    INVALID_CHECKSUM,
  };

  struct Ss58Address {
    uint16_t prefix;
    common::Buffer account;
  };

  /**
   * Length of the truncated Blake2b-512 checksum for account of
   * {@param account_length} bytes
   * @return 1 for 1, 2, 4 and 8 byte accounts, 2 for 32 and 33 byte ones,
   * nullopt for other lengths
   */
  std::optional<size_t> ss58ChecksumLength(size_t account_length);

  /**
   * Decode SS58 address: base58(<prefix><account><checksum>), checksum is
   * Blake2b-512("SS58PRE" || prefix || account) truncated
   */
  outcome::result<Ss58Address> decodeSs58(std::string_view address,
                                          const crypto::Hasher &hasher);

  outcome::result<std::string> encodeSs58(uint16_t prefix,
                                          common::BufferView account,
                                          const crypto::Hasher &hasher);

}  // namespace foxchain::checksum

OUTCOME_HPP_DECLARE_ERROR(foxchain::checksum, Ss58Error);
