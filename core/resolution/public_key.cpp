/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "resolution/public_key.hpp"

#include <algorithm>

#include "common/visitor.hpp"

namespace foxchain::resolution {

  namespace secp256k1 = crypto::secp256k1;

  namespace {
    template <typename Key>
    Key copyKey(common::BufferView bytes) {
      Key key;
      std::copy(bytes.begin(), bytes.end(), key.begin());
      return key;
    }
  }  // namespace

  std::optional<KeyShape> detectKeyShape(common::BufferView bytes) {
    switch (bytes.size()) {
      case secp256k1::constants::kCompressedPublicKeySize:
        return copyKey<secp256k1::CompressedPublicKey>(bytes);
      case secp256k1::constants::kUncompressedPublicKeySize:
        return copyKey<secp256k1::UncompressedPublicKey>(bytes);
      case Ed25519LikePublicKey::size():
        return copyKey<Ed25519LikePublicKey>(bytes);
      default:
        return std::nullopt;
    }
  }

  registry::KeyType keyTypeOf(const PublicKey &key) {
    return visit_in_place(
        key,
        [](const Secp256k1PublicKey &) { return registry::KeyType::SECP256K1; },
        [](const Ed25519LikePublicKey &) { return registry::KeyType::ED25519; });
  }

  common::BufferView givenBytes(const PublicKey &key) {
    return visit_in_place(
        key,
        [](const Secp256k1PublicKey &k) -> common::BufferView {
          return k.given;
        },
        [](const Ed25519LikePublicKey &k) { return k.view(); });
  }

}  // namespace foxchain::resolution
