/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include "crypto/hasher.hpp"
#include "outcome/outcome.hpp"
#include "registry/chain_descriptor.hpp"
#include "resolution/public_key.hpp"

namespace foxchain::resolution {

  enum class DerivationError {
    KEY_TYPE_MISMATCH = 1,
    NOT_ENOUGH_BYTES,
    INVALID_ENCODER_INPUT,
  };

  /**
   * Runs derivation steps of a chain over a public key and encodes the
   * result as an address
   */
  class DerivationPipeline {
   public:
    explicit DerivationPipeline(std::shared_ptr<crypto::Hasher> hasher);

    outcome::result<std::string> derive(
        const PublicKey &key, const registry::DerivationSpec &derivation) const;

   private:
    outcome::result<void> apply(const registry::PipelineStep &pipeline_step,
                                const PublicKey &key,
                                common::Buffer &bytes) const;

    outcome::result<common::Buffer> serialize(
        const PublicKey &key, registry::KeySerialization form) const;

    common::Buffer hash(registry::HashAlgorithm algorithm,
                        common::BufferView data) const;

    outcome::result<std::string> encode(const registry::OutputEncoder &encoder,
                                        common::BufferView data) const;

    std::shared_ptr<crypto::Hasher> hasher_;
  };

}  // namespace foxchain::resolution

OUTCOME_HPP_DECLARE_ERROR(foxchain::resolution, DerivationError);
