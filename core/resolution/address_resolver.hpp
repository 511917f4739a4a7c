/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <utility>
#include <vector>

#include "crypto/hasher.hpp"
#include "input/input_signature.hpp"
#include "log/logger.hpp"
#include "registry/chain_registry.hpp"
#include "resolution/match.hpp"

namespace foxchain::resolution {

  /**
   * Reads input as an address: every family listed in the signature is
   * decoded and validated, then matched against the registered formats
   */
  class AddressResolver {
   public:
    AddressResolver(std::shared_ptr<const registry::ChainRegistry> registry,
                    std::shared_ptr<crypto::Hasher> hasher);

    /**
     * @return one match per chain accepting the input, and the reasons of
     * every rejected interpretation
     */
    Resolution resolve(const input::InputSignature &signature) const;

   private:
    template <typename Format>
    using Fitting =
        std::vector<std::pair<const registry::ChainDescriptor *, const Format *>>;

    template <typename Format>
    Fitting<Format> fitting(const input::InputSignature &signature) const;

    void resolveHex(const input::InputSignature &signature,
                    Resolution &resolution) const;
    void resolveBase58Check(const input::InputSignature &signature,
                            Resolution &resolution) const;
    void resolveBech32(const input::InputSignature &signature,
                       Resolution &resolution) const;
    void resolveBase58(const input::InputSignature &signature,
                       Resolution &resolution) const;
    void resolveSs58(const input::InputSignature &signature,
                     Resolution &resolution) const;

    void reject(Resolution &resolution,
                registry::EncodingFamily family,
                std::error_code reason) const;

    std::shared_ptr<const registry::ChainRegistry> registry_;
    std::shared_ptr<crypto::Hasher> hasher_;
    log::Logger logger_;
  };

}  // namespace foxchain::resolution
