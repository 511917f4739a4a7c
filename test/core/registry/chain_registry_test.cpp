/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/chain_registry.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using namespace foxchain::registry;
using foxchain::input::InputSignature;

namespace {
  ChainDescriptor chainWith(std::string id, AddressFormat format) {
    return {.id = std::move(id), .name = "Test", .group = "test",
            .formats = {std::move(format)}};
  }

  DerivationSpec derivation(KeyType key_type,
                            std::vector<PipelineStep> steps,
                            OutputEncoder encoder = encoder::Base58{}) {
    return {.key_type = key_type,
            .steps = std::move(steps),
            .encoder = std::move(encoder)};
  }

  std::vector<std::string> idsOf(
      const std::vector<const ChainDescriptor *> &chains) {
    std::vector<std::string> ids;
    for (auto chain : chains) {
      ids.push_back(chain->id);
    }
    return ids;
  }
}  // namespace

/**
 * @given built-in chains
 * @when build default registry
 * @then every chain is present in declaration order
 */
TEST(ChainRegistryTest, DefaultRegistry) {
  auto registry = defaultRegistry();
  ASSERT_EQ(registry->chains().size(), 29);
  EXPECT_EQ(registry, defaultRegistry());

  auto ethereum = registry->findById("ethereum");
  ASSERT_NE(ethereum, nullptr);
  EXPECT_TRUE(ethereum->primary);
  EXPECT_EQ(registry->indexOf(*ethereum), 0);

  auto bitcoin = registry->findById("bitcoin");
  ASSERT_NE(bitcoin, nullptr);
  EXPECT_EQ(registry->indexOf(*bitcoin), 10);
  EXPECT_TRUE(bitcoin->hasFamily(EncodingFamily::BASE58CHECK));
  EXPECT_TRUE(bitcoin->hasFamily(EncodingFamily::BECH32));

  EXPECT_EQ(registry->findById("unknown"), nullptr);
}

/**
 * @given default registry
 * @when query chains by encoding family
 * @then chains accepting the family are returned in declaration order
 */
TEST(ChainRegistryTest, ByFamily) {
  auto registry = defaultRegistry();
  auto evm = idsOf(registry->byFamily(EncodingFamily::HEX));
  EXPECT_EQ(evm,
            (std::vector<std::string>{"ethereum", "polygon", "bsc",
                                      "avalanche", "arbitrum", "optimism",
                                      "base", "fantom", "celo", "gnosis"}));
  EXPECT_EQ(idsOf(registry->byFamily(EncodingFamily::SS58)),
            (std::vector<std::string>{"polkadot", "kusama", "substrate"}));
  EXPECT_EQ(idsOf(registry->byFamily(EncodingFamily::BASE58)),
            (std::vector<std::string>{"solana"}));
  EXPECT_EQ(registry->byFamily(EncodingFamily::BECH32).size(), 13);
}

/**
 * @given default registry
 * @when query chains by key type
 * @then chains having a derivation for it are returned
 */
TEST(ChainRegistryTest, ByKeyType) {
  auto registry = defaultRegistry();
  EXPECT_EQ(registry->byKeyType(KeyType::SECP256K1).size(), 27);
  auto ed25519 = idsOf(registry->byKeyType(KeyType::ED25519));
  ASSERT_EQ(ed25519.size(), 15);
  EXPECT_EQ(ed25519.front(), "solana");
  EXPECT_EQ(ed25519.back(), "cardano");
}

/**
 * @given signatures of hex and bech32 inputs
 * @when query chains by signature
 * @then only chains whose constraints the facts fit are returned
 */
TEST(ChainRegistryTest, BySignature) {
  auto registry = defaultRegistry();

  InputSignature evm{
      .input = "0xd8da6bf26964af9d7eed9e03e53415d37aa96045",
      .families = {EncodingFamily::HEX},
      .has_0x_prefix = true,
      .hex_length = 20,
  };
  EXPECT_EQ(registry->bySignature(evm).size(), 10);

  auto short_hex = evm;
  short_hex.hex_length = 19;
  EXPECT_TRUE(registry->bySignature(short_hex).empty());

  auto no_prefix = evm;
  no_prefix.has_0x_prefix = false;
  EXPECT_TRUE(registry->bySignature(no_prefix).empty());

  InputSignature osmo{
      .input = "osmo1w508d6qejxtdg4y5r3zarvary0c5xw7kjxy2e2",
      .families = {EncodingFamily::BECH32},
      .bech32_hrp = "osmo",
  };
  EXPECT_EQ(idsOf(registry->bySignature(osmo)),
            (std::vector<std::string>{"osmosis"}));
}

/**
 * @given SS58 formats with one-byte and two-byte prefixes
 * @when check decoded lengths against them
 * @then prefix length is counted in
 */
TEST(ChainRegistryTest, Ss58Fits) {
  InputSignature signature{
      .input = "-",
      .families = {EncodingFamily::SS58},
      .base58_length = 35,
  };
  EXPECT_TRUE(fitsSignature(Ss58Format{.prefix = 42}, signature));
  EXPECT_FALSE(fitsSignature(Ss58Format{.prefix = 136}, signature));
  signature.base58_length = 36;
  EXPECT_TRUE(fitsSignature(Ss58Format{.prefix = 136}, signature));
  signature.families.clear();
  EXPECT_FALSE(fitsSignature(Ss58Format{.prefix = 136}, signature));
}

/**
 * @given descriptors with broken identity or formats
 * @when create registry
 * @then the inconsistency is reported
 */
TEST(ChainRegistryTest, InvalidDescriptors) {
  EXPECT_EC(ChainRegistry::create({chainWith("", HexFormat{})}),
            ChainRegistryError::EMPTY_CHAIN_ID);
  EXPECT_EC(ChainRegistry::create(
                {chainWith("a", HexFormat{}), chainWith("a", Base58Format{})}),
            ChainRegistryError::DUPLICATE_CHAIN_ID);
  EXPECT_EC(ChainRegistry::create({ChainDescriptor{.id = "a"}}),
            ChainRegistryError::MISSING_ADDRESS_FORMAT);
  EXPECT_EC(ChainRegistry::create({chainWith("a", HexFormat{.length = 0})}),
            ChainRegistryError::INVALID_LENGTH_RANGE);
  EXPECT_EC(ChainRegistry::create({chainWith("a", Base58CheckFormat{})}),
            ChainRegistryError::MISSING_VERSION_BYTES);
  EXPECT_EC(ChainRegistry::create(
                {chainWith("a", Bech32Format{.hrps = {"Cosmos"}})}),
            ChainRegistryError::INVALID_HRP);
  EXPECT_EC(ChainRegistry::create({chainWith(
                "a",
                Bech32Format{
                    .hrps = {"a"}, .min_length = 30, .max_length = 20})}),
            ChainRegistryError::INVALID_LENGTH_RANGE);
  EXPECT_EC(ChainRegistry::create({chainWith("a", Ss58Format{.prefix = 16384})}),
            ChainRegistryError::INVALID_SS58_PREFIX);
  EXPECT_EC(ChainRegistry::create({chainWith(
                "a", Ss58Format{.prefix = 0, .account_lengths = {20}})}),
            ChainRegistryError::INVALID_LENGTH_RANGE);
}

/**
 * @given descriptors with broken derivations
 * @when create registry
 * @then the inconsistency is reported
 */
TEST(ChainRegistryTest, InvalidDerivations) {
  auto with = [](std::vector<DerivationSpec> derivations) {
    auto chain = chainWith("a", Base58Format{});
    chain.derivations = std::move(derivations);
    return ChainRegistry::create({std::move(chain)});
  };
  auto raw = step::SerializeKey{KeySerialization::RAW};
  auto compressed = step::SerializeKey{KeySerialization::COMPRESSED};

  EXPECT_EC(with({derivation(KeyType::ED25519, {raw}),
                  derivation(KeyType::ED25519, {raw})}),
            ChainRegistryError::DUPLICATE_KEY_TYPE);
  EXPECT_EC(with({derivation(KeyType::ED25519, {})}),
            ChainRegistryError::MISSING_KEY_SERIALIZATION);
  EXPECT_EC(
      with({derivation(KeyType::ED25519,
                       {step::Hash{HashAlgorithm::SHA2_256}, raw})}),
      ChainRegistryError::MISSING_KEY_SERIALIZATION);
  EXPECT_EC(with({derivation(KeyType::ED25519, {compressed})}),
            ChainRegistryError::INCOMPATIBLE_KEY_SERIALIZATION);
  EXPECT_EC(with({derivation(KeyType::SECP256K1, {raw})}),
            ChainRegistryError::INCOMPATIBLE_KEY_SERIALIZATION);
  EXPECT_EC(with({derivation(KeyType::ED25519, {raw}, encoder::Bech32{""})}),
            ChainRegistryError::INVALID_HRP);
  EXPECT_EC(
      with({derivation(KeyType::ED25519, {raw}, encoder::Ss58{20000})}),
      ChainRegistryError::INVALID_SS58_PREFIX);

  EXPECT_OUTCOME_TRUE(registry,
                      with({derivation(KeyType::ED25519, {raw}),
                            derivation(KeyType::SECP256K1, {compressed})}));
  EXPECT_EQ(registry->byKeyType(KeyType::SECP256K1).size(), 1);
}
