/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "resolution/derivation_pipeline.hpp"

#include "checksum/base58check.hpp"
#include "checksum/bech32.hpp"
#include "checksum/eip55.hpp"
#include "checksum/ss58.hpp"
#include "common/visitor.hpp"
#include "encoding/base58.hpp"
#include "encoding/bech32.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(foxchain::resolution, DerivationError, e) {
  using E = foxchain::resolution::DerivationError;
  switch (e) {
    case E::KEY_TYPE_MISMATCH:
      return "Key serialization does not apply to the key type";
    case E::NOT_ENOUGH_BYTES:
      return "Derivation step takes more bytes than available";
    case E::INVALID_ENCODER_INPUT:
      return "Derived bytes do not fit the address encoder";
  }
  return "Unknown derivation error";
}

namespace foxchain::resolution {

  using registry::HashAlgorithm;
  using registry::KeySerialization;

  DerivationPipeline::DerivationPipeline(std::shared_ptr<crypto::Hasher> hasher)
      : hasher_{std::move(hasher)} {}

  outcome::result<std::string> DerivationPipeline::derive(
      const PublicKey &key, const registry::DerivationSpec &derivation) const {
    if (keyTypeOf(key) != derivation.key_type) {
      return DerivationError::KEY_TYPE_MISMATCH;
    }

    common::Buffer bytes;
    for (auto &pipeline_step : derivation.steps) {
      OUTCOME_TRY(apply(pipeline_step, key, bytes));
    }

    return encode(derivation.encoder, bytes);
  }

  outcome::result<void> DerivationPipeline::apply(
      const registry::PipelineStep &pipeline_step,
      const PublicKey &key,
      common::Buffer &bytes) const {
    return visit_in_place(
        pipeline_step,
        [&](const registry::step::SerializeKey &s) -> outcome::result<void> {
          OUTCOME_TRY(serialized, serialize(key, s.form));
          bytes = std::move(serialized);
          return outcome::success();
        },
        [&](const registry::step::Hash &s) -> outcome::result<void> {
          bytes = hash(s.algorithm, bytes);
          return outcome::success();
        },
        [&](const registry::step::TakeFirst &s) -> outcome::result<void> {
          if (s.count > bytes.size()) {
            return DerivationError::NOT_ENOUGH_BYTES;
          }
          bytes = common::Buffer(bytes.view(0, s.count));
          return outcome::success();
        },
        [&](const registry::step::TakeLast &s) -> outcome::result<void> {
          if (s.count > bytes.size()) {
            return DerivationError::NOT_ENOUGH_BYTES;
          }
          bytes = common::Buffer(bytes.view(bytes.size() - s.count, s.count));
          return outcome::success();
        },
        [&](const registry::step::Prepend &s) -> outcome::result<void> {
          bytes.insert(bytes.begin(), s.bytes.begin(), s.bytes.end());
          return outcome::success();
        });
  }

  outcome::result<common::Buffer> DerivationPipeline::serialize(
      const PublicKey &key, KeySerialization form) const {
    return visit_in_place(
        key,
        [&](const Secp256k1PublicKey &k) -> outcome::result<common::Buffer> {
          switch (form) {
            case KeySerialization::AS_GIVEN:
              return k.given;
            case KeySerialization::COMPRESSED:
              return common::Buffer(k.compressed.view());
            case KeySerialization::UNCOMPRESSED:
              return common::Buffer(k.uncompressed.view());
            case KeySerialization::UNCOMPRESSED_XY:
              return common::Buffer(k.uncompressed.view().subspan(1));
            case KeySerialization::RAW:
              break;
          }
          return DerivationError::KEY_TYPE_MISMATCH;
        },
        [&](const Ed25519LikePublicKey &k) -> outcome::result<common::Buffer> {
          if (form == KeySerialization::RAW
              or form == KeySerialization::AS_GIVEN) {
            return common::Buffer(k.view());
          }
          return DerivationError::KEY_TYPE_MISMATCH;
        });
  }

  common::Buffer DerivationPipeline::hash(HashAlgorithm algorithm,
                                          common::BufferView data) const {
    switch (algorithm) {
      case HashAlgorithm::SHA2_256:
        return common::Buffer(hasher_->sha2_256(data).view());
      case HashAlgorithm::SHA3_256:
        return common::Buffer(hasher_->sha3_256(data).view());
      case HashAlgorithm::KECCAK_256:
        return common::Buffer(hasher_->keccak_256(data).view());
      case HashAlgorithm::RIPEMD_160:
        return common::Buffer(hasher_->ripemd_160(data).view());
      case HashAlgorithm::BLAKE2B_256:
        return common::Buffer(hasher_->blake2b_256(data).view());
    }
    return common::Buffer(data);
  }

  outcome::result<std::string> DerivationPipeline::encode(
      const registry::OutputEncoder &encoder, common::BufferView data) const {
    return visit_in_place(
        encoder,
        [&](const registry::encoder::Eip55 &) -> outcome::result<std::string> {
          if (data.size() != checksum::kEvmAddressLength) {
            return DerivationError::INVALID_ENCODER_INPUT;
          }
          return checksum::toEip55(data, *hasher_);
        },
        [&](const registry::encoder::Base58Check &)
            -> outcome::result<std::string> {
          if (data.empty()) {
            return DerivationError::INVALID_ENCODER_INPUT;
          }
          return checksum::encodeBase58Check(data, *hasher_);
        },
        [&](const registry::encoder::Base58 &) -> outcome::result<std::string> {
          return encoding::encodeBase58(data);
        },
        [&](const registry::encoder::Bech32 &e) -> outcome::result<std::string> {
          OUTCOME_TRY(values, encoding::convertBits(data, 8, 5, true));
          return checksum::encodeBech32(e.hrp, values);
        },
        [&](const registry::encoder::Ss58 &e) -> outcome::result<std::string> {
          return checksum::encodeSs58(e.prefix, data, *hasher_);
        });
  }

}  // namespace foxchain::resolution
