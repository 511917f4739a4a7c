/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace foxchain::crypto {
  /**
   * Unkeyed BLAKE2b with the digest length set to {@param out}.size()
   */
  void blake2b(std::span<uint8_t> out, common::BufferView in);

  template <size_t N>
  common::Blob<N> blake2b(common::BufferView in) {
    static_assert(N > 0 and N <= 64, "BLAKE2b digest is 1..64 bytes");
    common::Blob<N> out;
    blake2b(out, in);
    return out;
  }
}  // namespace foxchain::crypto
