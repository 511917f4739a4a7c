/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "resolution/public_key_resolver.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/format.h>

#include "checksum/bech32.hpp"
#include "common/hexutil.hpp"
#include "common/visitor.hpp"
#include "encoding/base58.hpp"
#include "encoding/bech32.hpp"
#include "resolution/resolution_error.hpp"

namespace foxchain::resolution {

  namespace secp256k1 = crypto::secp256k1;

  using registry::EncodingFamily;
  using registry::KeyType;

  namespace {
    /// hex keys are lowercased with "0x", Bech32 is lowercased, Base58 is
    /// case-sensitive and kept as given
    std::string normalizedKey(const input::InputSignature &signature,
                              EncodingFamily family,
                              const PublicKey &key) {
      switch (family) {
        case EncodingFamily::BASE58:
          return signature.input;
        case EncodingFamily::BECH32: {
          std::string res = signature.input;
          std::transform(
              res.begin(), res.end(), res.begin(), [](unsigned char c) {
                return static_cast<char>(std::tolower(c));
              });
          return res;
        }
        default:
          return common::hex_lower_0x(givenBytes(key));
      }
    }
  }  // namespace

  PublicKeyResolver::PublicKeyResolver(
      std::shared_ptr<const registry::ChainRegistry> registry,
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<crypto::Secp256k1Provider> secp256k1_provider)
      : registry_{std::move(registry)},
        secp256k1_provider_{std::move(secp256k1_provider)},
        pipeline_{std::move(hasher)},
        logger_{log::createLogger("PublicKeyResolver",
                                  "public_key_resolution")} {}

  Resolution PublicKeyResolver::resolve(
      const input::InputSignature &signature) const {
    Resolution resolution;

    std::vector<common::Buffer> processed;
    for (auto &[family, bytes] : decodings(signature)) {
      auto shape = detectKeyShape(bytes);
      if (not shape) {
        continue;
      }
      // one key may come out of several decodings
      if (std::find(processed.begin(), processed.end(), bytes)
          != processed.end()) {
        continue;
      }
      processed.push_back(bytes);

      auto key = toPublicKey(shape.value());
      if (key.has_error()) {
        SL_DEBUG(logger_,
                 "{} is not a valid public key: {}",
                 bytes.view(),
                 key.error().message());
        resolution.rejections.emplace_back(key.error());
        continue;
      }
      derive(key.value(),
             family,
             normalizedKey(signature, family, key.value()),
             resolution);
    }
    return resolution;
  }

  std::vector<PublicKeyResolver::Decoding> PublicKeyResolver::decodings(
      const input::InputSignature &signature) const {
    std::vector<Decoding> res;
    if (signature.contains(EncodingFamily::HEX)) {
      if (auto bytes = common::unhex(signature.hexDigits())) {
        res.push_back({EncodingFamily::HEX, std::move(bytes.value())});
      }
    }
    if (signature.base58_length) {
      if (auto bytes = encoding::decodeBase58(signature.input)) {
        res.push_back({EncodingFamily::BASE58, std::move(bytes.value())});
      }
    }
    if (signature.contains(EncodingFamily::BECH32)) {
      if (auto decoded = checksum::decodeBech32(
              signature.input, encoding::kBech32ExtendedMaxLength)) {
        if (auto bytes =
                encoding::convertBits(decoded.value().data, 5, 8, false)) {
          res.push_back({EncodingFamily::BECH32, std::move(bytes.value())});
        }
      }
    }
    return res;
  }

  outcome::result<PublicKey> PublicKeyResolver::toPublicKey(
      const KeyShape &shape) const {
    return visit_in_place(
        shape,
        [&](const secp256k1::CompressedPublicKey &compressed)
            -> outcome::result<PublicKey> {
          OUTCOME_TRY(uncompressed, secp256k1_provider_->decompress(compressed));
          return Secp256k1PublicKey{
              .given = common::Buffer(compressed.view()),
              .compressed = compressed,
              .uncompressed = uncompressed,
          };
        },
        [&](const secp256k1::UncompressedPublicKey &uncompressed)
            -> outcome::result<PublicKey> {
          if (uncompressed[0] != secp256k1::constants::kUncompressedTag) {
            return ResolutionError::UNKNOWN_KEY_TAG;
          }
          OUTCOME_TRY(compressed, secp256k1_provider_->compress(uncompressed));
          return Secp256k1PublicKey{
              .given = common::Buffer(uncompressed.view()),
              .compressed = compressed,
              .uncompressed = uncompressed,
          };
        },
        [&](const Ed25519LikePublicKey &key) -> outcome::result<PublicKey> {
          return key;
        });
  }

  void PublicKeyResolver::derive(const PublicKey &key,
                                 EncodingFamily family,
                                 const std::string &normalized,
                                 Resolution &resolution) const {
    const auto key_type = keyTypeOf(key);
    const auto chains = registry_->byKeyType(key_type);
    if (chains.empty()) {
      SL_DEBUG(logger_,
               "No chain derives addresses from {} keys",
               registry::toString(key_type));
      resolution.rejections.emplace_back(
          ResolutionError::NO_DERIVATION_PIPELINE);
      return;
    }

    const auto evidence = key_type == KeyType::SECP256K1
                            ? Evidence::DERIVED_SECP256K1
                            : Evidence::DERIVED_ED25519;
    for (auto chain : chains) {
      auto address = pipeline_.derive(key, *chain->derivationFor(key_type));
      if (address.has_error()) {
        SL_DEBUG(logger_,
                 "Derivation for chain {} failed: {}",
                 chain->id,
                 address.error().message());
        resolution.rejections.emplace_back(address.error());
        continue;
      }
      SL_TRACE(logger_,
               "Derived {} address {} from key {}",
               chain->id,
               address.value(),
               normalized);
      resolution.matches.push_back({
          .chain = chain,
          .kind = InputKind::PUBLIC_KEY,
          .encodings = {family},
          .evidence = evidence,
          .reasoning = fmt::format("{} public key, address derived for {}",
                                   registry::toString(key_type),
                                   chain->name),
          .normalized = normalized,
          .derived_address = std::move(address.value()),
      });
    }
  }

}  // namespace foxchain::resolution
