/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/hasher/hasher_impl.hpp"

#include "crypto/blake2/blake2b.hpp"
#include "crypto/keccak/keccak.hpp"
#include "crypto/ripemd/ripemd160.hpp"
#include "crypto/sha/sha256.hpp"

namespace foxchain::crypto {
  using common::Hash160;
  using common::Hash256;
  using common::Hash512;

  Hash256 HasherImpl::sha2_256(common::BufferView data) const {
    return crypto::sha256(data);
  }

  Hash256 HasherImpl::sha3_256(common::BufferView data) const {
    return crypto::sha3_256(data);
  }

  Hash256 HasherImpl::keccak_256(common::BufferView data) const {
    return crypto::keccak(data);
  }

  Hash160 HasherImpl::ripemd_160(common::BufferView data) const {
    return crypto::ripemd160(data);
  }

  Hash256 HasherImpl::blake2b_256(common::BufferView data) const {
    return crypto::blake2b<32>(data);
  }

  Hash512 HasherImpl::blake2b_512(common::BufferView data) const {
    return crypto::blake2b<64>(data);
  }
}  // namespace foxchain::crypto
