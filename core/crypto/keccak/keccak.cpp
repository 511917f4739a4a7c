/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/keccak/keccak.hpp"

#include <cryptopp/keccak.h>
#include <cryptopp/sha3.h>

namespace foxchain::crypto {
  common::Hash256 keccak(common::BufferView buf) {
    static_assert(CryptoPP::Keccak_256::DIGESTSIZE == common::Hash256::size());
    common::Hash256 out;
    CryptoPP::Keccak_256 hash;
    hash.Update(buf.data(), buf.size());
    hash.Final(out.data());
    return out;
  }

  common::Hash256 sha3_256(common::BufferView buf) {
    static_assert(CryptoPP::SHA3_256::DIGESTSIZE == common::Hash256::size());
    common::Hash256 out;
    CryptoPP::SHA3_256 hash;
    hash.Update(buf.data(), buf.size());
    hash.Final(out.data());
    return out;
  }
}  // namespace foxchain::crypto
