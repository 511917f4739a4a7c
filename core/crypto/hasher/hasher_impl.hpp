/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/hasher.hpp"

namespace foxchain::crypto {

  class HasherImpl : public Hasher {
   public:
    ~HasherImpl() override = default;

    Hash256 sha2_256(common::BufferView data) const override;

    Hash256 sha3_256(common::BufferView data) const override;

    Hash256 keccak_256(common::BufferView data) const override;

    Hash160 ripemd_160(common::BufferView data) const override;

    Hash256 blake2b_256(common::BufferView data) const override;

    Hash512 blake2b_512(common::BufferView data) const override;
  };

}  // namespace foxchain::crypto
