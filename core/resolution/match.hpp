/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "registry/chain_descriptor.hpp"
#include "registry/encoding_family.hpp"

namespace foxchain::resolution {

  /**
   * What a match rests on, strongest first
   */
  enum class Evidence : uint8_t {
    /// checksum verified
    CHECKSUM,
    /// structure is valid, but the encoding carries no checksum to verify
    UNCHECKSUMMED,
    /// only the decoded length discriminates
    LENGTH_ONLY,
    /// address derived from a secp256k1 public key
    DERIVED_SECP256K1,
    /// address derived from an Ed25519-like public key
    DERIVED_ED25519,
  };

  /// what the input was read as
  enum class InputKind : uint8_t {
    ADDRESS,
    PUBLIC_KEY,
  };

  /**
   * Interpretation of the input for one chain
   */
  struct Match {
    /// points into the registry the match was produced from
    const registry::ChainDescriptor *chain;
    InputKind kind;
    /// encodings the input was decoded with, in registry family order
    std::vector<registry::EncodingFamily> encodings;
    Evidence evidence;
    std::string reasoning;
    /// canonical form of the input
    std::string normalized;
    std::optional<std::string> derived_address;
  };

  struct Resolution {
    /// at most one per chain
    std::vector<Match> matches;
    /// why other interpretations were dropped
    std::vector<std::error_code> rejections;
  };

}  // namespace foxchain::resolution
