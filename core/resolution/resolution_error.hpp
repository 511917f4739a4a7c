/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace foxchain::resolution {

  /**
   * Reasons to reject an interpretation which decoded successfully but does
   * not fit any registered chain
   */
  enum class ResolutionError {
    UNKNOWN_PREFIX = 1,
    LENGTH_MISMATCH,
    INVALID_WITNESS_PROGRAM,
    BECH32_VARIANT_MISMATCH,
    UNKNOWN_KEY_TAG,
    NO_DERIVATION_PIPELINE,
  };

}  // namespace foxchain::resolution

OUTCOME_HPP_DECLARE_ERROR(foxchain::resolution, ResolutionError);
