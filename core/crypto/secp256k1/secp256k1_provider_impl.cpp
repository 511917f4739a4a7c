/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/secp256k1/secp256k1_provider_impl.hpp"

#include <algorithm>

#include <boost/multiprecision/cpp_int.hpp>

#include "common/mp_utils.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(foxchain::crypto, Secp256k1ProviderError, e) {
  using E = foxchain::crypto::Secp256k1ProviderError;
  switch (e) {
    case E::INVALID_TAG:
      return "secp256k1 public key has invalid tag byte";
    case E::COORDINATE_OUT_OF_RANGE:
      return "secp256k1 coordinate is not less than the field prime";
    case E::POINT_NOT_ON_CURVE:
      return "secp256k1 public key is not a point on the curve";
    case E::SERIALIZATION_FAILED:
      return "secp256k1 public key serialization failed";
  }
  return "unknown Secp256k1ProviderError error occured";
}

namespace foxchain::crypto {

  namespace {
    using common::uint256_t;
    using common::uint512_t;

    const uint512_t kFieldPrime(
        "0xFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFFEFFFFFC2F");
    const uint512_t kCurveB = 7;
    const uint512_t kSqrtExponent = (kFieldPrime + 1) / 4;
  }  // namespace

  Secp256k1ProviderImpl::Secp256k1ProviderImpl()
      : context_(secp256k1_context_create(SECP256K1_CONTEXT_VERIFY),
                 secp256k1_context_destroy),
        logger_{log::createLogger("Secp256k1Provider", "secp256k1")} {}

  outcome::result<secp256k1::UncompressedPublicKey>
  Secp256k1ProviderImpl::decompress(
      const secp256k1::CompressedPublicKey &key) const {
    namespace constants = secp256k1::constants;
    const auto tag = key[0];
    if (tag != constants::kCompressedEvenTag
        and tag != constants::kCompressedOddTag) {
      return Secp256k1ProviderError::INVALID_TAG;
    }

    auto x_bytes = std::span<const uint8_t, 32>(key.data() + 1, 32);
    const uint512_t x{common::be_bytes_to_uint256(x_bytes)};
    if (x >= kFieldPrime) {
      return Secp256k1ProviderError::COORDINATE_OUT_OF_RANGE;
    }

    const uint512_t rhs = (x * x % kFieldPrime * x + kCurveB) % kFieldPrime;
    uint512_t y = boost::multiprecision::powm(rhs, kSqrtExponent, kFieldPrime);
    if (y * y % kFieldPrime != rhs) {
      SL_TRACE(logger_, "x = {} has no matching y", key.toHex());
      return Secp256k1ProviderError::POINT_NOT_ON_CURVE;
    }

    const bool want_odd = tag == constants::kCompressedOddTag;
    if (boost::multiprecision::bit_test(y, 0) != want_odd) {
      y = kFieldPrime - y;
    }

    secp256k1::UncompressedPublicKey res;
    res[0] = constants::kUncompressedTag;
    std::copy(key.begin() + 1, key.end(), res.begin() + 1);
    auto y_bytes = common::uint256_to_be_bytes(static_cast<uint256_t>(y));
    std::copy(y_bytes.begin(), y_bytes.end(), res.begin() + 33);
    return res;
  }

  outcome::result<secp256k1::CompressedPublicKey>
  Secp256k1ProviderImpl::compress(
      const secp256k1::UncompressedPublicKey &key) const {
    if (key[0] != secp256k1::constants::kUncompressedTag) {
      return Secp256k1ProviderError::INVALID_TAG;
    }

    secp256k1_pubkey pubkey;
    if (1
        != secp256k1_ec_pubkey_parse(
            context_.get(), &pubkey, key.data(), key.size())) {
      return Secp256k1ProviderError::POINT_NOT_ON_CURVE;
    }

    secp256k1::CompressedPublicKey pubkey_out;
    size_t outputlen = secp256k1::CompressedPublicKey::size();
    if (1
        != secp256k1_ec_pubkey_serialize(context_.get(),
                                         pubkey_out.data(),
                                         &outputlen,
                                         &pubkey,
                                         SECP256K1_EC_COMPRESSED)) {
      return Secp256k1ProviderError::SERIALIZATION_FAILED;
    }
    return pubkey_out;
  }
}  // namespace foxchain::crypto
