/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/builtin_chains.hpp"

namespace foxchain::registry {

  namespace {
    constexpr uint8_t kCardanoEnterpriseMainnetHeader = 0x61;
    constexpr size_t kCardanoKeyHashLength = 28;

    DerivationSpec evmDerivation() {
      return {
          .key_type = KeyType::SECP256K1,
          .steps = {step::SerializeKey{KeySerialization::UNCOMPRESSED_XY},
                    step::Hash{HashAlgorithm::KECCAK_256},
                    step::TakeLast{20}},
          .encoder = encoder::Eip55{},
      };
    }

    /// Hash160 of the key in the form it was given, behind a version byte
    DerivationSpec p2pkhDerivation(uint8_t version) {
      return {
          .key_type = KeyType::SECP256K1,
          .steps = {step::SerializeKey{KeySerialization::AS_GIVEN},
                    step::Hash{HashAlgorithm::SHA2_256},
                    step::Hash{HashAlgorithm::RIPEMD_160},
                    step::Prepend{common::Buffer{version}}},
          .encoder = encoder::Base58Check{},
      };
    }

    /// BIP-173/BIP-350 witness program, v0 or later
    Bech32Format segwitFormat(std::string hrp) {
      return {
          .hrps = {std::move(hrp)},
          .min_length = 2,
          .max_length = 40,
          .segwit = true,
      };
    }

    ChainDescriptor evmChain(std::string id, std::string name, bool primary) {
      return {
          .id = std::move(id),
          .name = std::move(name),
          .group = "evm",
          .primary = primary,
          .formats = {HexFormat{}},
          .derivations = {evmDerivation()},
      };
    }

    ChainDescriptor cosmosChain(std::string id,
                                std::string name,
                                std::string hrp,
                                bool primary) {
      return {
          .id = std::move(id),
          .name = std::move(name),
          .group = "cosmos",
          .primary = primary,
          .formats = {Bech32Format{
              .hrps = {hrp},
              .min_length = 20,
              .max_length = 32,
          }},
          .derivations =
              {
                  {
                      .key_type = KeyType::ED25519,
                      .steps = {step::SerializeKey{KeySerialization::RAW},
                                step::Hash{HashAlgorithm::SHA2_256},
                                step::TakeFirst{20}},
                      .encoder = encoder::Bech32{hrp},
                  },
                  {
                      .key_type = KeyType::SECP256K1,
                      .steps =
                          {step::SerializeKey{KeySerialization::COMPRESSED},
                           step::Hash{HashAlgorithm::SHA2_256},
                           step::Hash{HashAlgorithm::RIPEMD_160}},
                      .encoder = encoder::Bech32{hrp},
                  },
              },
      };
    }

    ChainDescriptor substrateChain(std::string id,
                                   std::string name,
                                   uint16_t prefix,
                                   bool primary) {
      return {
          .id = std::move(id),
          .name = std::move(name),
          .group = "substrate",
          .primary = primary,
          .formats = {Ss58Format{.prefix = prefix}},
          .derivations =
              {
                  {
                      .key_type = KeyType::ED25519,
                      .steps = {step::SerializeKey{KeySerialization::RAW}},
                      .encoder = encoder::Ss58{prefix},
                  },
                  {
                      .key_type = KeyType::SECP256K1,
                      .steps =
                          {step::SerializeKey{KeySerialization::COMPRESSED},
                           step::Hash{HashAlgorithm::BLAKE2B_256}},
                      .encoder = encoder::Ss58{prefix},
                  },
              },
      };
    }
  }  // namespace

  std::vector<ChainDescriptor> builtinChains() {
    std::vector<ChainDescriptor> chains;

    chains.push_back(evmChain("ethereum", "Ethereum", true));
    chains.push_back(evmChain("polygon", "Polygon", false));
    chains.push_back(evmChain("bsc", "BNB Smart Chain", false));
    chains.push_back(evmChain("avalanche", "Avalanche C-Chain", false));
    chains.push_back(evmChain("arbitrum", "Arbitrum One", false));
    chains.push_back(evmChain("optimism", "Optimism", false));
    chains.push_back(evmChain("base", "Base", false));
    chains.push_back(evmChain("fantom", "Fantom Opera", false));
    chains.push_back(evmChain("celo", "Celo", false));
    chains.push_back(evmChain("gnosis", "Gnosis Chain", false));

    chains.push_back({
        .id = "bitcoin",
        .name = "Bitcoin",
        .group = "bitcoin",
        .formats = {Base58CheckFormat{
                        .versions = {{0x00, "P2PKH"}, {0x05, "P2SH"}},
                    },
                    segwitFormat("bc")},
        .derivations = {p2pkhDerivation(0x00)},
    });
    chains.push_back({
        .id = "litecoin",
        .name = "Litecoin",
        .group = "litecoin",
        .formats = {Base58CheckFormat{
                        .versions = {{0x30, "P2PKH"}, {0x32, "P2SH"}},
                    },
                    segwitFormat("ltc")},
        .derivations = {p2pkhDerivation(0x30)},
    });
    chains.push_back({
        .id = "dogecoin",
        .name = "Dogecoin",
        .group = "dogecoin",
        .formats = {Base58CheckFormat{
            .versions = {{0x1e, "P2PKH"}, {0x16, "P2SH"}},
        }},
        .derivations = {p2pkhDerivation(0x1e)},
    });
    chains.push_back({
        .id = "tron",
        .name = "Tron",
        .group = "tron",
        .formats = {Base58CheckFormat{.versions = {{0x41, "account"}}}},
        .derivations = {{
            .key_type = KeyType::SECP256K1,
            .steps = {step::SerializeKey{KeySerialization::UNCOMPRESSED_XY},
                      step::Hash{HashAlgorithm::KECCAK_256},
                      step::TakeLast{20},
                      step::Prepend{common::Buffer{uint8_t{0x41}}}},
            .encoder = encoder::Base58Check{},
        }},
    });
    chains.push_back({
        .id = "solana",
        .name = "Solana",
        .group = "solana",
        .formats = {Base58Format{}},
        .derivations = {{
            .key_type = KeyType::ED25519,
            .steps = {step::SerializeKey{KeySerialization::RAW}},
            .encoder = encoder::Base58{},
        }},
    });

    chains.push_back(cosmosChain("cosmos-hub", "Cosmos Hub", "cosmos", true));
    chains.push_back(cosmosChain("osmosis", "Osmosis", "osmo", false));
    chains.push_back(cosmosChain("juno", "Juno", "juno", false));
    chains.push_back(cosmosChain("akash", "Akash", "akash", false));
    chains.push_back(cosmosChain("stargaze", "Stargaze", "stars", false));
    chains.push_back(
        cosmosChain("secret-network", "Secret Network", "secret", false));
    chains.push_back(cosmosChain("terra", "Terra", "terra", false));
    chains.push_back(cosmosChain("kava", "Kava", "kava", false));
    chains.push_back(cosmosChain("regen", "Regen", "regen", false));
    chains.push_back(cosmosChain("sentinel", "Sentinel", "sent", false));

    chains.push_back(substrateChain("polkadot", "Polkadot", 0, true));
    chains.push_back(substrateChain("kusama", "Kusama", 2, false));
    chains.push_back(substrateChain("substrate", "Substrate", 42, false));

    chains.push_back({
        .id = "cardano",
        .name = "Cardano",
        .group = "cardano",
        .formats = {Bech32Format{
            .hrps = {"addr", "addr_test", "stake", "stake_test"},
            .min_length = 29,
            .max_length = 64,
            .max_string_length = encoding::kBech32ExtendedMaxLength,
        }},
        .derivations = {{
            .key_type = KeyType::ED25519,
            .steps =
                {step::SerializeKey{KeySerialization::RAW},
                 step::Hash{HashAlgorithm::SHA3_256},
                 step::TakeFirst{kCardanoKeyHashLength},
                 step::Prepend{
                     common::Buffer{kCardanoEnterpriseMainnetHeader}}},
            .encoder = encoder::Bech32{"addr"},
        }},
    });

    return chains;
  }

}  // namespace foxchain::registry
