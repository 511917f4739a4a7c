/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string_view>

#include "crypto/hasher.hpp"
#include "crypto/secp256k1_provider.hpp"
#include "identification/identification_result.hpp"
#include "identification/identify_error.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "registry/chain_registry.hpp"
#include "resolution/address_resolver.hpp"
#include "resolution/public_key_resolver.hpp"

namespace foxchain::identification {

  /**
   * Classifies a string as an address or public key of known chains.
   * Immutable after construction, one instance may serve many threads.
   */
  class Identifier {
   public:
    Identifier(std::shared_ptr<const registry::ChainRegistry> registry,
               std::shared_ptr<crypto::Hasher> hasher,
               std::shared_ptr<crypto::Secp256k1Provider> secp256k1_provider);

    /**
     * Reads {@param input} as an address first; when no chain accepts it as
     * an address, reads it as a public key and derives addresses
     * @return candidates ranked by confidence, or the most specific reason
     * why nothing matched
     */
    outcome::result<IdentificationResult> identify(
        std::string_view input) const;

   private:
    IdentificationResult rank(
        const std::vector<resolution::Match> &matches) const;

    std::shared_ptr<const registry::ChainRegistry> registry_;
    resolution::AddressResolver address_resolver_;
    resolution::PublicKeyResolver public_key_resolver_;
    log::Logger logger_;
  };

  /**
   * Identifies {@param input} against the built-in chain registry
   */
  outcome::result<IdentificationResult> identify(std::string_view input);

}  // namespace foxchain::identification
