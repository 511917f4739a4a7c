/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "checksum/base58check.hpp"

#include <algorithm>

#include "encoding/base58.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(foxchain::checksum, Base58CheckError, e) {
  using E = foxchain::checksum::Base58CheckError;
  switch (e) {
    case E::TOO_SHORT:
      return "Base58Check data is shorter than its checksum";
    case E::CHECKSUM_MISMATCH:
      return "Base58Check checksum mismatch";
  }
  return "Unknown Base58Check error";
}

namespace foxchain::checksum {

  Base58Checksum computeBase58Checksum(common::BufferView data,
                                       const crypto::Hasher &hasher) {
    auto first = hasher.sha2_256(data);
    auto second = hasher.sha2_256(first.view());
    Base58Checksum checksum;
    std::copy_n(second.begin(), checksum.size(), checksum.begin());
    return checksum;
  }

  std::string encodeBase58Check(common::BufferView data,
                                const crypto::Hasher &hasher) {
    auto checksum = computeBase58Checksum(data, hasher);
    auto bytes = common::Buffer{data}.put(checksum);
    return encoding::encodeBase58(bytes);
  }

  outcome::result<common::Buffer> decodeBase58Check(
      std::string_view str, const crypto::Hasher &hasher) {
    OUTCOME_TRY(bytes, encoding::decodeBase58(str));
    if (bytes.size() < kBase58CheckChecksumLength) {
      return Base58CheckError::TOO_SHORT;
    }

    auto data = bytes.view(0, bytes.size() - kBase58CheckChecksumLength);
    auto checksum = bytes.view(data.size(), kBase58CheckChecksumLength);
    if (common::BufferView(computeBase58Checksum(data, hasher))
        != checksum) {
      return Base58CheckError::CHECKSUM_MISMATCH;
    }
    return common::Buffer{data};
  }

}  // namespace foxchain::checksum
