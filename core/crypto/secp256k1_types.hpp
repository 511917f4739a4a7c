/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace foxchain::crypto::secp256k1 {
  namespace constants {
    static constexpr size_t kUncompressedPublicKeySize = 65u;
    static constexpr size_t kCompressedPublicKeySize = 33u;

    static constexpr uint8_t kUncompressedTag = 0x04;
    static constexpr uint8_t kCompressedEvenTag = 0x02;
    static constexpr uint8_t kCompressedOddTag = 0x03;
  }  // namespace constants

  /**
   * compressed form of public key: parity tag and x coordinate
   */
  using CompressedPublicKey = common::Blob<constants::kCompressedPublicKeySize>;

  /**
   * uncompressed form of public key: 0x04 tag, x and y coordinates
   */
  using UncompressedPublicKey =
      common::Blob<constants::kUncompressedPublicKeySize>;
}  // namespace foxchain::crypto::secp256k1
