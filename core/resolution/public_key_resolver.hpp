/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "crypto/hasher.hpp"
#include "crypto/secp256k1_provider.hpp"
#include "input/input_signature.hpp"
#include "log/logger.hpp"
#include "registry/chain_registry.hpp"
#include "resolution/derivation_pipeline.hpp"
#include "resolution/match.hpp"
#include "resolution/public_key.hpp"

namespace foxchain::resolution {

  /**
   * Reads input as a public key and derives its address for every chain
   * with a derivation for the key type
   */
  class PublicKeyResolver {
   public:
    PublicKeyResolver(
        std::shared_ptr<const registry::ChainRegistry> registry,
        std::shared_ptr<crypto::Hasher> hasher,
        std::shared_ptr<crypto::Secp256k1Provider> secp256k1_provider);

    Resolution resolve(const input::InputSignature &signature) const;

   private:
    struct Decoding {
      registry::EncodingFamily family;
      common::Buffer bytes;
    };

    /**
     * Every byte string the input decodes to: hex, Base58 and Bech32 data
     */
    std::vector<Decoding> decodings(
        const input::InputSignature &signature) const;

    /**
     * Validates secp256k1 point and completes missing serializations
     */
    outcome::result<PublicKey> toPublicKey(const KeyShape &shape) const;

    /**
     * Derives addresses of {@param key} decoded with {@param family}, the
     * key keeps its given form as {@param normalized}
     */
    void derive(const PublicKey &key,
                registry::EncodingFamily family,
                const std::string &normalized,
                Resolution &resolution) const;

    std::shared_ptr<const registry::ChainRegistry> registry_;
    std::shared_ptr<crypto::Secp256k1Provider> secp256k1_provider_;
    DerivationPipeline pipeline_;
    log::Logger logger_;
  };

}  // namespace foxchain::resolution
