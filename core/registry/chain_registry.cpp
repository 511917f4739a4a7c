/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/chain_registry.hpp"

#include <algorithm>
#include <set>

#include "checksum/base58check.hpp"
#include "checksum/ss58.hpp"
#include "common/visitor.hpp"
#include "encoding/ss58.hpp"
#include "registry/builtin_chains.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(foxchain::registry, ChainRegistryError, e) {
  using E = foxchain::registry::ChainRegistryError;
  switch (e) {
    case E::EMPTY_CHAIN_ID:
      return "Chain identifier is empty";
    case E::DUPLICATE_CHAIN_ID:
      return "Chain identifier is declared twice";
    case E::DUPLICATE_KEY_TYPE:
      return "Chain declares two derivations for one key type";
    case E::MISSING_KEY_SERIALIZATION:
      return "Derivation pipeline must start with key serialization";
    case E::INCOMPATIBLE_KEY_SERIALIZATION:
      return "Key serialization does not fit the key type of derivation";
    case E::INVALID_HRP:
      return "Bech32 human-readable part is empty or not lowercase";
    case E::INVALID_SS58_PREFIX:
      return "SS58 prefix is out of range";
    case E::INVALID_LENGTH_RANGE:
      return "Length constraint is empty or inverted";
    case E::MISSING_VERSION_BYTES:
      return "Base58Check format declares no version bytes";
    case E::MISSING_ADDRESS_FORMAT:
      return "Chain declares no address format";
  }
  return "Unknown chain registry error";
}

namespace foxchain::registry {

  namespace {
    bool isValidHrp(std::string_view hrp) {
      return not hrp.empty()
         and std::all_of(hrp.begin(), hrp.end(), [](char c) {
               return c >= 33 and c <= 126 and not(c >= 'A' and c <= 'Z');
             });
    }

    size_t ss58PrefixLength(uint16_t prefix) {
      return prefix <= encoding::kSs58MaxSimplePrefix ? 1 : 2;
    }

    outcome::result<void> validateFormat(const AddressFormat &format) {
      return visit_in_place(
          format,
          [](const HexFormat &f) -> outcome::result<void> {
            if (f.length == 0) {
              return ChainRegistryError::INVALID_LENGTH_RANGE;
            }
            return outcome::success();
          },
          [](const Base58CheckFormat &f) -> outcome::result<void> {
            if (f.versions.empty()) {
              return ChainRegistryError::MISSING_VERSION_BYTES;
            }
            if (f.payload_length == 0) {
              return ChainRegistryError::INVALID_LENGTH_RANGE;
            }
            return outcome::success();
          },
          [](const Bech32Format &f) -> outcome::result<void> {
            if (f.hrps.empty()
                or not std::all_of(f.hrps.begin(), f.hrps.end(), isValidHrp)) {
              return ChainRegistryError::INVALID_HRP;
            }
            if (f.min_length == 0 or f.min_length > f.max_length) {
              return ChainRegistryError::INVALID_LENGTH_RANGE;
            }
            return outcome::success();
          },
          [](const Base58Format &f) -> outcome::result<void> {
            if (f.min_length == 0 or f.min_length > f.max_length) {
              return ChainRegistryError::INVALID_LENGTH_RANGE;
            }
            return outcome::success();
          },
          [](const Ss58Format &f) -> outcome::result<void> {
            if (f.prefix > encoding::kSs58MaxPrefix) {
              return ChainRegistryError::INVALID_SS58_PREFIX;
            }
            if (f.account_lengths.empty()
                or not std::all_of(f.account_lengths.begin(),
                                   f.account_lengths.end(),
                                   [](size_t length) {
                                     return checksum::ss58ChecksumLength(length)
                                        .has_value();
                                   })) {
              return ChainRegistryError::INVALID_LENGTH_RANGE;
            }
            return outcome::success();
          });
    }

    bool fitsKeyType(KeySerialization form, KeyType key_type) {
      switch (key_type) {
        case KeyType::SECP256K1:
          return form != KeySerialization::RAW;
        case KeyType::ED25519:
          return form == KeySerialization::RAW
              or form == KeySerialization::AS_GIVEN;
      }
      return false;
    }

    outcome::result<void> validateDerivation(const DerivationSpec &derivation) {
      if (derivation.steps.empty()
          or not std::holds_alternative<step::SerializeKey>(
              derivation.steps.front())) {
        return ChainRegistryError::MISSING_KEY_SERIALIZATION;
      }
      for (auto &pipeline_step : derivation.steps) {
        if (auto serialize = std::get_if<step::SerializeKey>(&pipeline_step);
            serialize and not fitsKeyType(serialize->form, derivation.key_type)) {
          return ChainRegistryError::INCOMPATIBLE_KEY_SERIALIZATION;
        }
      }
      return visit_in_place(
          derivation.encoder,
          [](const encoder::Bech32 &e) -> outcome::result<void> {
            if (not isValidHrp(e.hrp)) {
              return ChainRegistryError::INVALID_HRP;
            }
            return outcome::success();
          },
          [](const encoder::Ss58 &e) -> outcome::result<void> {
            if (e.prefix > encoding::kSs58MaxPrefix) {
              return ChainRegistryError::INVALID_SS58_PREFIX;
            }
            return outcome::success();
          },
          [](const auto &) -> outcome::result<void> {
            return outcome::success();
          });
    }

  }  // namespace

  bool fitsSignature(const AddressFormat &format,
                     const input::InputSignature &signature) {
    if (not signature.contains(familyOf(format))) {
      return false;
    }
    return visit_in_place(
        format,
        [&](const HexFormat &f) {
          return signature.has_0x_prefix == f.require_0x_prefix
             and signature.hex_length == f.length;
        },
        [&](const Base58CheckFormat &f) {
          return signature.base58_length
              == 1 + f.payload_length + checksum::kBase58CheckChecksumLength;
        },
        [&](const Bech32Format &f) {
          return signature.bech32_hrp
             and std::find(f.hrps.begin(), f.hrps.end(), *signature.bech32_hrp)
                     != f.hrps.end()
             and signature.input.size() <= f.max_string_length;
        },
        [&](const Base58Format &f) {
          return signature.base58_length
             and *signature.base58_length >= f.min_length
             and *signature.base58_length <= f.max_length;
        },
        [&](const Ss58Format &f) {
          if (not signature.base58_length) {
            return false;
          }
          return std::any_of(
              f.account_lengths.begin(),
              f.account_lengths.end(),
              [&](size_t account_length) {
                auto checksum_length =
                    checksum::ss58ChecksumLength(account_length);
                return checksum_length
                   and *signature.base58_length
                           == ss58PrefixLength(f.prefix) + account_length
                                  + *checksum_length;
              });
        });
  }

  ChainRegistry::ChainRegistry(std::vector<ChainDescriptor> chains)
      : chains_{std::move(chains)} {}

  outcome::result<std::shared_ptr<const ChainRegistry>> ChainRegistry::create(
      std::vector<ChainDescriptor> chains) {
    std::set<std::string_view> ids;
    for (auto &chain : chains) {
      if (chain.id.empty()) {
        return ChainRegistryError::EMPTY_CHAIN_ID;
      }
      if (not ids.emplace(chain.id).second) {
        return ChainRegistryError::DUPLICATE_CHAIN_ID;
      }
      if (chain.formats.empty()) {
        return ChainRegistryError::MISSING_ADDRESS_FORMAT;
      }
      for (auto &format : chain.formats) {
        OUTCOME_TRY(validateFormat(format));
      }

      std::set<KeyType> key_types;
      for (auto &derivation : chain.derivations) {
        if (not key_types.emplace(derivation.key_type).second) {
          return ChainRegistryError::DUPLICATE_KEY_TYPE;
        }
        OUTCOME_TRY(validateDerivation(derivation));
      }
    }

    // done so because of private constructor
    return std::shared_ptr<const ChainRegistry>{
        new ChainRegistry(std::move(chains))};
  }

  const ChainDescriptor *ChainRegistry::findById(std::string_view id) const {
    auto it = std::find_if(chains_.begin(),
                           chains_.end(),
                           [&](const auto &chain) { return chain.id == id; });
    return it != chains_.end() ? &*it : nullptr;
  }

  size_t ChainRegistry::indexOf(const ChainDescriptor &chain) const {
    return static_cast<size_t>(&chain - chains_.data());
  }

  std::vector<const ChainDescriptor *> ChainRegistry::byFamily(
      EncodingFamily family) const {
    std::vector<const ChainDescriptor *> res;
    for (auto &chain : chains_) {
      if (chain.hasFamily(family)) {
        res.push_back(&chain);
      }
    }
    return res;
  }

  std::vector<const ChainDescriptor *> ChainRegistry::bySignature(
      const input::InputSignature &signature) const {
    std::vector<const ChainDescriptor *> res;
    for (auto &chain : chains_) {
      if (std::any_of(chain.formats.begin(),
                      chain.formats.end(),
                      [&](const auto &format) {
                        return fitsSignature(format, signature);
                      })) {
        res.push_back(&chain);
      }
    }
    return res;
  }

  std::vector<const ChainDescriptor *> ChainRegistry::byKeyType(
      KeyType key_type) const {
    std::vector<const ChainDescriptor *> res;
    for (auto &chain : chains_) {
      if (chain.derivationFor(key_type) != nullptr) {
        res.push_back(&chain);
      }
    }
    return res;
  }

  std::shared_ptr<const ChainRegistry> defaultRegistry() {
    static const auto registry = ChainRegistry::create(builtinChains()).value();
    return registry;
  }

}  // namespace foxchain::registry
