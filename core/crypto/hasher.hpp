/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/buffer_view.hpp"

namespace foxchain::crypto {
  class Hasher {
   protected:
    using Hash160 = common::Hash160;
    using Hash256 = common::Hash256;
    using Hash512 = common::Hash512;

   public:
    virtual ~Hasher() = default;

    /**
     * @brief sha2_256 function calculates 32-byte sha2-256 hash
     * @param data source value
     * @return 256-bit hash value
     */
    virtual Hash256 sha2_256(common::BufferView data) const = 0;

    /**
     * @brief sha3_256 function calculates 32-byte FIPS 202 sha3-256 hash
     * @param data source value
     * @return 256-bit hash value
     */
    virtual Hash256 sha3_256(common::BufferView data) const = 0;

    /**
     * @brief keccak_256 function calculates 32-byte keccak hash
     * @param data source value
     * @return 256-bit hash value
     */
    virtual Hash256 keccak_256(common::BufferView data) const = 0;

    /**
     * @brief ripemd_160 function calculates 20-byte ripemd-160 hash
     * @param data source value
     * @return 160-bit hash value
     */
    virtual Hash160 ripemd_160(common::BufferView data) const = 0;

    /**
     * @brief blake2b_256 function calculates 32-byte blake2b hash
     * @param data source value
     * @return 256-bit hash value
     */
    virtual Hash256 blake2b_256(common::BufferView data) const = 0;

    /**
     * @brief blake2b_512 function calculates 64-byte blake2b hash
     * @param data source value
     * @return 512-bit hash value
     */
    virtual Hash512 blake2b_512(common::BufferView data) const = 0;
  };
}  // namespace foxchain::crypto
