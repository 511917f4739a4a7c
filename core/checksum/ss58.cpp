/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "checksum/ss58.hpp"

#include <optional>

#include "encoding/base58.hpp"
#include "encoding/ss58.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(foxchain::checksum, Ss58Error, e) {
  using E = foxchain::checksum::Ss58Error;
  switch (e) {
    case E::INVALID_LENGTH:
      return "Invalid SS58 address length";
    case E::INVALID_CHECKSUM:
      return "Invalid SS58 checksum";
  }
  return "Unknown SS58 codec error";
}

namespace foxchain::checksum {

  namespace {
    common::Hash512 calculateChecksum(common::BufferView prefixed_account,
                                      const crypto::Hasher &hasher) {
      constexpr auto PREFIX = "SS58PRE";
      auto preimage = common::Buffer{}.put(PREFIX).put(prefixed_account);
      return hasher.blake2b_512(preimage);
    }
  }  // namespace

  std::optional<size_t> ss58ChecksumLength(size_t account_length) {
    switch (account_length) {
      case 1:
      case 2:
      case 4:
      case 8:
        return 1;
      case 32:
      case 33:
        return 2;
      default:
        return std::nullopt;
    }
  }

  outcome::result<Ss58Address> decodeSs58(std::string_view address,
                                          const crypto::Hasher &hasher) {
    OUTCOME_TRY(bytes, encoding::decodeBase58(address));
    OUTCOME_TRY(prefix, encoding::decodeSs58Prefix(bytes));

    const size_t rest = bytes.size() - prefix.length;
    std::optional<size_t> checksum_length;
    for (size_t candidate : {1u, 2u}) {
      if (rest > candidate
          and ss58ChecksumLength(rest - candidate) == candidate) {
        checksum_length = candidate;
      }
    }
    if (not checksum_length) {
      return Ss58Error::INVALID_LENGTH;
    }

    auto body = bytes.view(0, bytes.size() - *checksum_length);
    auto checksum = bytes.view(body.size(), *checksum_length);
    auto calculated = calculateChecksum(body, hasher);
    if (common::BufferView(calculated.view().first(*checksum_length))
        != checksum) {
      return Ss58Error::INVALID_CHECKSUM;
    }

    return Ss58Address{
        .prefix = prefix.value,
        .account = common::Buffer{body.subspan(prefix.length)},
    };
  }

  outcome::result<std::string> encodeSs58(uint16_t prefix,
                                          common::BufferView account,
                                          const crypto::Hasher &hasher) {
    auto checksum_length = ss58ChecksumLength(account.size());
    if (not checksum_length) {
      return Ss58Error::INVALID_LENGTH;
    }
    OUTCOME_TRY(ss58_bytes, encoding::encodeSs58Prefix(prefix));
    ss58_bytes.put(account);
    auto checksum = calculateChecksum(ss58_bytes, hasher);
    ss58_bytes.put(checksum.view().first(*checksum_length));
    return encoding::encodeBase58(ss58_bytes);
  }

}  // namespace foxchain::checksum
