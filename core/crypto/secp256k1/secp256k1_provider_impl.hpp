/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <secp256k1.h>

#include "crypto/secp256k1_provider.hpp"
#include "log/logger.hpp"

namespace foxchain::crypto {

  enum class Secp256k1ProviderError {
    INVALID_TAG = 1,
    COORDINATE_OUT_OF_RANGE,
    POINT_NOT_ON_CURVE,
    SERIALIZATION_FAILED,
  };

  class Secp256k1ProviderImpl : public Secp256k1Provider {
   public:
    Secp256k1ProviderImpl();

    ~Secp256k1ProviderImpl() override = default;

    /**
     * Computes y = (x^3 + 7)^((p + 1) / 4) mod p, which is a square root
     * because p = 3 mod 4, and picks the root matching the parity tag
     */
    outcome::result<secp256k1::UncompressedPublicKey> decompress(
        const secp256k1::CompressedPublicKey &key) const override;

    outcome::result<secp256k1::CompressedPublicKey> compress(
        const secp256k1::UncompressedPublicKey &key) const override;

   private:
    std::unique_ptr<secp256k1_context, void (*)(secp256k1_context *)> context_;
    log::Logger logger_;
  };
}  // namespace foxchain::crypto

OUTCOME_HPP_DECLARE_ERROR(foxchain::crypto, Secp256k1ProviderError);
