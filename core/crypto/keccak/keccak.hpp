/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace foxchain::crypto {
  /**
   * Original Keccak-256 (pre-FIPS padding), as used by Ethereum
   */
  common::Hash256 keccak(common::BufferView buf);

  /**
   * SHA3-256 (FIPS 202), Keccak with the standardized padding
   */
  common::Hash256 sha3_256(common::BufferView buf);
}  // namespace foxchain::crypto
