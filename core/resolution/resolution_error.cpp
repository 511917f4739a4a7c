/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "resolution/resolution_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(foxchain::resolution, ResolutionError, e) {
  using E = foxchain::resolution::ResolutionError;
  switch (e) {
    case E::UNKNOWN_PREFIX:
      return "Prefix of the address is not registered for any chain";
    case E::LENGTH_MISMATCH:
      return "Payload length does not fit chains with this prefix";
    case E::INVALID_WITNESS_PROGRAM:
      return "Invalid segwit version or witness program length";
    case E::BECH32_VARIANT_MISMATCH:
      return "Checksum variant does not fit the witness version";
    case E::UNKNOWN_KEY_TAG:
      return "Public key has unknown secp256k1 tag";
    case E::NO_DERIVATION_PIPELINE:
      return "No chain derives an address from this key type";
  }
  return "Unknown resolution error";
}
