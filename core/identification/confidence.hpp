/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "resolution/match.hpp"

namespace foxchain::identification {

  namespace confidence {
    constexpr double kChecksumUnique = 0.95;
    constexpr double kChecksumPrimary = 0.90;
    constexpr double kChecksumSibling = 0.85;
    constexpr double kUnchecksummedPrimary = 0.75;
    constexpr double kUnchecksummedSibling = 0.70;
    constexpr double kLengthOnlyPrimary = 0.60;
    constexpr double kLengthOnlySibling = 0.55;
    constexpr double kDerivedSecp256k1Primary = 0.80;
    constexpr double kDerivedSecp256k1Sibling = 0.75;
    constexpr double kDerivedEd25519Primary = 0.70;
    constexpr double kDerivedEd25519Sibling = 0.65;
  }  // namespace confidence

  /**
   * Confidence of a match
   * @param shared more than one chain of the group matched the same input
   * @param primary the chain leads its group
   */
  constexpr double confidenceOf(resolution::Evidence evidence,
                                bool shared,
                                bool primary) {
    using resolution::Evidence;
    const bool leading = not shared or primary;
    switch (evidence) {
      case Evidence::CHECKSUM:
        if (not shared) {
          return confidence::kChecksumUnique;
        }
        return primary ? confidence::kChecksumPrimary
                       : confidence::kChecksumSibling;
      case Evidence::UNCHECKSUMMED:
        return leading ? confidence::kUnchecksummedPrimary
                       : confidence::kUnchecksummedSibling;
      case Evidence::LENGTH_ONLY:
        return leading ? confidence::kLengthOnlyPrimary
                       : confidence::kLengthOnlySibling;
      case Evidence::DERIVED_SECP256K1:
        return leading ? confidence::kDerivedSecp256k1Primary
                       : confidence::kDerivedSecp256k1Sibling;
      case Evidence::DERIVED_ED25519:
        return leading ? confidence::kDerivedEd25519Primary
                       : confidence::kDerivedEd25519Sibling;
    }
    return 0.;
  }

}  // namespace foxchain::identification
