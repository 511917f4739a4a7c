/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/blake2/blake2b.hpp"

#include <cryptopp/blake2.h>

namespace foxchain::crypto {
  void blake2b(std::span<uint8_t> out, common::BufferView in) {
    CryptoPP::BLAKE2b hash(false, static_cast<unsigned int>(out.size()));
    hash.Update(in.data(), in.size());
    hash.Final(out.data());
  }
}  // namespace foxchain::crypto
