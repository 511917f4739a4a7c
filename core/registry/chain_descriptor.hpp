/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "common/buffer.hpp"
#include "encoding/bech32.hpp"
#include "registry/encoding_family.hpp"

namespace foxchain::registry {

  /// Hex digits, e.g. EVM "0x" + 40 digits
  struct HexFormat {
    bool require_0x_prefix = true;
    /// decoded length in bytes
    size_t length = 20;
  };

  struct VersionByte {
    uint8_t value;
    /// kind of address the version denotes, e.g. "P2PKH"
    std::string kind;
  };

  /// Base58(version || payload || checksum)
  struct Base58CheckFormat {
    std::vector<VersionByte> versions;
    /// payload length in bytes, version and checksum excluded
    size_t payload_length = 20;
  };

  struct Bech32Format {
    std::vector<std::string> hrps;
    /// program length range in bytes
    size_t min_length = 20;
    size_t max_length = 20;
    /// first 5-bit group is a witness version (BIP-173/BIP-350)
    bool segwit = false;
    size_t max_string_length = encoding::kBech32MaxLength;
  };

  /// Plain Base58 without checksum; only the decoded length discriminates
  struct Base58Format {
    size_t min_length = 32;
    size_t max_length = 32;
  };

  struct Ss58Format {
    uint16_t prefix = 42;
    std::vector<size_t> account_lengths{32};
  };

  /**
   * Structural constraints of an address. The alternative index is the
   * encoding family.
   */
  using AddressFormat = std::variant<HexFormat,
                                     Base58CheckFormat,
                                     Bech32Format,
                                     Base58Format,
                                     Ss58Format>;

  inline EncodingFamily familyOf(const AddressFormat &format) {
    return static_cast<EncodingFamily>(format.index());
  }

  enum class KeyType : uint8_t {
    SECP256K1,
    /// 32 bytes, Ed25519 and sr25519 keys are not told apart
    ED25519,
  };

  constexpr std::string_view toString(KeyType type) {
    switch (type) {
      case KeyType::SECP256K1:
        return "secp256k1";
      case KeyType::ED25519:
        return "ed25519";
    }
    return "unknown";
  }

  enum class KeySerialization : uint8_t {
    /// bytes exactly as they were provided
    AS_GIVEN,
    /// 33 bytes: parity tag and x
    COMPRESSED,
    /// 65 bytes: 0x04, x and y
    UNCOMPRESSED,
    /// 64 bytes: x and y
    UNCOMPRESSED_XY,
    /// 32 bytes of an Ed25519-like key
    RAW,
  };

  enum class HashAlgorithm : uint8_t {
    SHA2_256,
    SHA3_256,
    KECCAK_256,
    RIPEMD_160,
    BLAKE2B_256,
  };

  namespace step {
    struct SerializeKey {
      KeySerialization form;
    };

    struct Hash {
      HashAlgorithm algorithm;
    };

    struct TakeFirst {
      size_t count;
    };

    struct TakeLast {
      size_t count;
    };

    struct Prepend {
      common::Buffer bytes;
    };
  }  // namespace step

  using PipelineStep = std::variant<step::SerializeKey,
                                    step::Hash,
                                    step::TakeFirst,
                                    step::TakeLast,
                                    step::Prepend>;

  namespace encoder {
    /// "0x" + EIP-55 mixed case hex of 20 bytes
    struct Eip55 {};

    struct Base58Check {};

    struct Base58 {};

    struct Bech32 {
      std::string hrp;
    };

    struct Ss58 {
      uint16_t prefix;
    };
  }  // namespace encoder

  using OutputEncoder = std::variant<encoder::Eip55,
                                     encoder::Base58Check,
                                     encoder::Base58,
                                     encoder::Bech32,
                                     encoder::Ss58>;

  /**
   * How an address is derived from a public key: the key is serialized by
   * the first step, transformed by the rest and encoded at the end
   */
  struct DerivationSpec {
    KeyType key_type;
    std::vector<PipelineStep> steps;
    OutputEncoder encoder;
  };

  struct ChainDescriptor {
    /// stable identifier, e.g. "ethereum"
    std::string id;
    std::string name;
    /// chains of a group share one address shape
    std::string group;
    /// ranked above other chains of its group
    bool primary = false;
    /// every address shape the chain accepts, e.g. legacy and segwit
    std::vector<AddressFormat> formats;
    /// at most one per key type
    std::vector<DerivationSpec> derivations;

    bool hasFamily(EncodingFamily family) const {
      for (auto &format : formats) {
        if (familyOf(format) == family) {
          return true;
        }
      }
      return false;
    }

    const DerivationSpec *derivationFor(KeyType key_type) const {
      for (auto &derivation : derivations) {
        if (derivation.key_type == key_type) {
          return &derivation;
        }
      }
      return nullptr;
    }
  };

}  // namespace foxchain::registry
