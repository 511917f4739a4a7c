/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/ripemd/ripemd160.hpp"

#include <openssl/ripemd.h>

namespace foxchain::crypto {
  common::Hash160 ripemd160(common::BufferView input) {
    common::Hash160 out;
    RIPEMD160_CTX ctx;
    RIPEMD160_Init(&ctx);
    RIPEMD160_Update(&ctx, input.data(), input.size());
    RIPEMD160_Final(out.data(), &ctx);
    return out;
  }
}  // namespace foxchain::crypto
