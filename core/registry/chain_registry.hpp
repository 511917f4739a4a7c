/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "input/input_signature.hpp"
#include "outcome/outcome.hpp"
#include "registry/chain_descriptor.hpp"

namespace foxchain::registry {

  enum class ChainRegistryError {
    EMPTY_CHAIN_ID = 1,
    DUPLICATE_CHAIN_ID,
    DUPLICATE_KEY_TYPE,
    MISSING_KEY_SERIALIZATION,
    INCOMPATIBLE_KEY_SERIALIZATION,
    INVALID_HRP,
    INVALID_SS58_PREFIX,
    INVALID_LENGTH_RANGE,
    MISSING_VERSION_BYTES,
    MISSING_ADDRESS_FORMAT,
  };

  /**
   * @return true if {@param signature} lists the family of {@param format}
   * and its extracted facts do not contradict the format constraints
   */
  bool fitsSignature(const AddressFormat &format,
                     const input::InputSignature &signature);

  /**
   * Read-only table of chain descriptors. Declaration order is the
   * tie-break order of candidates.
   */
  class ChainRegistry {
   public:
    /**
     * Validates {@param chains} and builds registry of them
     */
    static outcome::result<std::shared_ptr<const ChainRegistry>> create(
        std::vector<ChainDescriptor> chains);

    const std::vector<ChainDescriptor> &chains() const {
      return chains_;
    }

    const ChainDescriptor *findById(std::string_view id) const;

    /**
     * Position of {@param chain} in declaration order
     */
    size_t indexOf(const ChainDescriptor &chain) const;

    std::vector<const ChainDescriptor *> byFamily(EncodingFamily family) const;

    /**
     * Descriptors with at least one format fitting {@param signature}
     */
    std::vector<const ChainDescriptor *> bySignature(
        const input::InputSignature &signature) const;

    /**
     * Descriptors able to derive an address from a key of {@param key_type}
     */
    std::vector<const ChainDescriptor *> byKeyType(KeyType key_type) const;

   private:
    explicit ChainRegistry(std::vector<ChainDescriptor> chains);

    std::vector<ChainDescriptor> chains_;
  };

  /**
   * Registry of built-in chains, built once on first use
   */
  std::shared_ptr<const ChainRegistry> defaultRegistry();

}  // namespace foxchain::registry

OUTCOME_HPP_DECLARE_ERROR(foxchain::registry, ChainRegistryError);
