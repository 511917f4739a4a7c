/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "identification/identify_error.hpp"

#include <algorithm>
#include <array>

#include "checksum/base58check.hpp"
#include "checksum/bech32.hpp"
#include "checksum/eip55.hpp"
#include "checksum/ss58.hpp"
#include "common/hexutil.hpp"
#include "crypto/secp256k1/secp256k1_provider_impl.hpp"
#include "encoding/base58.hpp"
#include "encoding/bech32.hpp"
#include "encoding/ss58.hpp"
#include "resolution/derivation_pipeline.hpp"
#include "resolution/resolution_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(foxchain::identification, IdentifyError, e) {
  using E = foxchain::identification::IdentifyError;
  switch (e) {
    case E::EMPTY_INPUT:
      return "Input is empty";
    case E::UNRECOGNIZED_FORMAT:
      return "Input matches no known address or public key format";
    case E::INVALID_ENCODING:
      return "Input has characters or case not allowed by its encoding";
    case E::INVALID_LENGTH:
      return "Decoded length does not fit any known chain";
    case E::UNSUPPORTED_PREFIX:
      return "Prefix, version byte or HRP is not known for any chain";
    case E::CHECKSUM_MISMATCH:
      return "Checksum verification failed";
    case E::INVALID_PUBLIC_KEY:
      return "Bytes shaped as public key are not a valid curve point";
    case E::DERIVATION_NOT_IMPLEMENTED:
      return "No chain implements address derivation for this key type";
  }
  return "Unknown identification error";
}

namespace foxchain::identification {

  namespace {
    template <typename Enum>
    bool isOf(const std::error_code &ec) {
      return ec.category() == make_error_code(Enum{}).category();
    }

    /// most specific first
    constexpr std::array kPriority{
        IdentifyError::DERIVATION_NOT_IMPLEMENTED,
        IdentifyError::CHECKSUM_MISMATCH,
        IdentifyError::INVALID_PUBLIC_KEY,
        IdentifyError::UNSUPPORTED_PREFIX,
        IdentifyError::INVALID_LENGTH,
        IdentifyError::INVALID_ENCODING,
        IdentifyError::UNRECOGNIZED_FORMAT,
        IdentifyError::EMPTY_INPUT,
    };
  }  // namespace

  ErrorKind errorKind(IdentifyError error) {
    if (error == IdentifyError::DERIVATION_NOT_IMPLEMENTED) {
      return ErrorKind::NOT_IMPLEMENTED;
    }
    return ErrorKind::INVALID_INPUT;
  }

  IdentifyError toIdentifyError(const std::error_code &ec) {
    using checksum::Base58CheckError;
    using checksum::Eip55Error;
    using checksum::Ss58Error;
    using encoding::Bech32Error;
    using encoding::Ss58PrefixError;
    using resolution::ResolutionError;

    if (isOf<IdentifyError>(ec)) {
      return static_cast<IdentifyError>(ec.value());
    }
    if (isOf<encoding::Base58Error>(ec) or isOf<encoding::ConvertBitsError>(ec)
        or isOf<common::UnhexError>(ec)) {
      return IdentifyError::INVALID_ENCODING;
    }
    if (isOf<Bech32Error>(ec)) {
      return ec == Bech32Error::TOO_SHORT or ec == Bech32Error::TOO_LONG
               ? IdentifyError::INVALID_LENGTH
               : IdentifyError::INVALID_ENCODING;
    }
    if (isOf<Ss58PrefixError>(ec)) {
      return ec == Ss58PrefixError::NOT_ENOUGH_DATA
               ? IdentifyError::INVALID_LENGTH
               : IdentifyError::UNSUPPORTED_PREFIX;
    }
    if (isOf<Base58CheckError>(ec)) {
      return ec == Base58CheckError::TOO_SHORT
               ? IdentifyError::INVALID_LENGTH
               : IdentifyError::CHECKSUM_MISMATCH;
    }
    if (isOf<checksum::Bech32ChecksumError>(ec)) {
      return IdentifyError::CHECKSUM_MISMATCH;
    }
    if (isOf<Eip55Error>(ec)) {
      if (ec == Eip55Error::INVALID_LENGTH) {
        return IdentifyError::INVALID_LENGTH;
      }
      if (ec == Eip55Error::NON_HEX_INPUT) {
        return IdentifyError::INVALID_ENCODING;
      }
      return IdentifyError::CHECKSUM_MISMATCH;
    }
    if (isOf<Ss58Error>(ec)) {
      return ec == Ss58Error::INVALID_LENGTH ? IdentifyError::INVALID_LENGTH
                                             : IdentifyError::CHECKSUM_MISMATCH;
    }
    if (isOf<crypto::Secp256k1ProviderError>(ec)) {
      return IdentifyError::INVALID_PUBLIC_KEY;
    }
    if (isOf<resolution::DerivationError>(ec)) {
      return IdentifyError::DERIVATION_NOT_IMPLEMENTED;
    }
    if (isOf<ResolutionError>(ec)) {
      switch (static_cast<ResolutionError>(ec.value())) {
        case ResolutionError::UNKNOWN_PREFIX:
          return IdentifyError::UNSUPPORTED_PREFIX;
        case ResolutionError::LENGTH_MISMATCH:
        case ResolutionError::INVALID_WITNESS_PROGRAM:
          return IdentifyError::INVALID_LENGTH;
        case ResolutionError::BECH32_VARIANT_MISMATCH:
          return IdentifyError::CHECKSUM_MISMATCH;
        case ResolutionError::UNKNOWN_KEY_TAG:
          return IdentifyError::INVALID_PUBLIC_KEY;
        case ResolutionError::NO_DERIVATION_PIPELINE:
          return IdentifyError::DERIVATION_NOT_IMPLEMENTED;
      }
    }
    return IdentifyError::UNRECOGNIZED_FORMAT;
  }

  IdentifyError mostSpecific(const std::vector<std::error_code> &rejections) {
    auto rank = [](IdentifyError error) {
      return std::find(kPriority.begin(), kPriority.end(), error)
           - kPriority.begin();
    };
    auto best = IdentifyError::UNRECOGNIZED_FORMAT;
    for (auto &ec : rejections) {
      auto reason = toIdentifyError(ec);
      if (rank(reason) < rank(best)) {
        best = reason;
      }
    }
    return best;
  }

}  // namespace foxchain::identification
