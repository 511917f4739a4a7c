/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <variant>

#include "common/blob.hpp"
#include "common/buffer.hpp"
#include "crypto/secp256k1_types.hpp"
#include "registry/chain_descriptor.hpp"

namespace foxchain::resolution {

  /**
   * 32 bytes of Ed25519 or sr25519 public key, these are not told apart
   */
  using Ed25519LikePublicKey = common::Blob<32>;

  /**
   * Bytes shaped as public key, before any curve validation
   */
  using KeyShape = std::variant<crypto::secp256k1::CompressedPublicKey,
                                crypto::secp256k1::UncompressedPublicKey,
                                Ed25519LikePublicKey>;

  /**
   * Recognizes key shape by length: 33 bytes tagged 0x02/0x03, 65 bytes
   * tagged 0x04 or 32 bytes
   * @return nullopt for bytes of any other length; tags are checked later
   */
  std::optional<KeyShape> detectKeyShape(common::BufferView bytes);

  /**
   * Valid secp256k1 point in every serialization a pipeline may ask for
   */
  struct Secp256k1PublicKey {
    /// bytes as they were provided, compressed or uncompressed
    common::Buffer given;
    crypto::secp256k1::CompressedPublicKey compressed;
    crypto::secp256k1::UncompressedPublicKey uncompressed;
  };

  using PublicKey = std::variant<Secp256k1PublicKey, Ed25519LikePublicKey>;

  registry::KeyType keyTypeOf(const PublicKey &key);

  /**
   * @return bytes of {@param key} as they were provided
   */
  common::BufferView givenBytes(const PublicKey &key);

}  // namespace foxchain::resolution
