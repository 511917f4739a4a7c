/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "checksum/eip55.hpp"

#include <cctype>

#include "common/hexutil.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(foxchain::checksum, Eip55Error, e) {
  using E = foxchain::checksum::Eip55Error;
  switch (e) {
    case E::INVALID_LENGTH:
      return "EVM address must have 40 hex digits";
    case E::NON_HEX_INPUT:
      return "EVM address contains non-hex characters";
    case E::CHECKSUM_MISMATCH:
      return "EIP-55 mixed case checksum mismatch";
  }
  return "Unknown EIP-55 error";
}

namespace foxchain::checksum {

  namespace {
    /// Applies EIP-55 casing to lowercase hex digits
    std::string applyChecksumCase(std::string lower,
                                  const crypto::Hasher &hasher) {
      auto hash = hasher.keccak_256(common::BufferView(
          // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
          reinterpret_cast<const uint8_t *>(lower.data()),
          lower.size()));
      for (size_t i = 0; i < lower.size(); ++i) {
        uint8_t nibble = (i % 2 == 0) ? hash[i / 2] >> 4 : hash[i / 2] & 0x0f;
        if (nibble >= 8 and std::isalpha(static_cast<unsigned char>(lower[i]))) {
          lower[i] = static_cast<char>(
              std::toupper(static_cast<unsigned char>(lower[i])));
        }
      }
      return lower;
    }
  }  // namespace

  std::string toEip55(common::BufferView address,
                      const crypto::Hasher &hasher) {
    return "0x" + applyChecksumCase(common::hex_lower(address), hasher);
  }

  outcome::result<Eip55Status> validateEip55(std::string_view hex_digits,
                                             const crypto::Hasher &hasher) {
    if (hex_digits.size() != kEvmAddressLength * 2) {
      return Eip55Error::INVALID_LENGTH;
    }
    if (not common::isHexDigits(hex_digits)) {
      return Eip55Error::NON_HEX_INPUT;
    }

    bool has_lower = false;
    bool has_upper = false;
    std::string lower;
    lower.reserve(hex_digits.size());
    for (char c : hex_digits) {
      auto uc = static_cast<unsigned char>(c);
      has_lower |= std::islower(uc) != 0;
      has_upper |= std::isupper(uc) != 0;
      lower.push_back(static_cast<char>(std::tolower(uc)));
    }

    if (not(has_lower and has_upper)) {
      return Eip55Status::UNCHECKSUMMED;
    }
    if (applyChecksumCase(std::move(lower), hasher) != hex_digits) {
      return Eip55Error::CHECKSUM_MISMATCH;
    }
    return Eip55Status::CHECKSUMMED;
  }

}  // namespace foxchain::checksum
