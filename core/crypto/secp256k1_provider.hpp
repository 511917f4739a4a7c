/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "crypto/secp256k1_types.hpp"
#include "outcome/outcome.hpp"

namespace foxchain::crypto {

  class Secp256k1Provider {
   public:
    virtual ~Secp256k1Provider() = default;

    /**
     * @brief restores y coordinate of a compressed public key
     * @param key parity tag (0x02 or 0x03) followed by x coordinate
     * @return the same point in uncompressed form, or error if the tag is
     * invalid or x is not a coordinate of a curve point
     */
    virtual outcome::result<secp256k1::UncompressedPublicKey> decompress(
        const secp256k1::CompressedPublicKey &key) const = 0;

    /**
     * @brief validates uncompressed public key and serializes it compressed
     * @param key 0x04 tag followed by x and y coordinates
     * @return compressed form of the point, or error if the point is not on
     * the curve
     */
    virtual outcome::result<secp256k1::CompressedPublicKey> compress(
        const secp256k1::UncompressedPublicKey &key) const = 0;
  };

}  // namespace foxchain::crypto
