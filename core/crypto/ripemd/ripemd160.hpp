/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace foxchain::crypto {
  /**
   * Take a RIPEMD-160 hash from bytes
   */
  common::Hash160 ripemd160(common::BufferView input);
}  // namespace foxchain::crypto
