/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "registry/encoding_family.hpp"
#include "resolution/match.hpp"

namespace foxchain::identification {

  using resolution::InputKind;

  /**
   * One plausible interpretation of the input
   */
  struct Candidate {
    /// chain identifier from the registry
    std::string chain;
    InputKind kind;
    /// encodings the input matched as
    std::vector<registry::EncodingFamily> encodings;
    /// in [0, 1]
    double confidence;
    std::string reasoning;
    /// address derived from public key input
    std::optional<std::string> derived_address;

    bool operator==(const Candidate &) const = default;
  };

  struct IdentificationResult {
    /// canonical form of the input under the top candidate
    std::string normalized;
    /// never empty; by confidence descending, then by registry order
    std::vector<Candidate> candidates;

    bool operator==(const IdentificationResult &) const = default;
  };

}  // namespace foxchain::identification
