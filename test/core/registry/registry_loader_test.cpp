/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/registry_loader.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace foxchain::registry;

class RegistryLoaderTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

 protected:
  using Error = RegistryLoader::Error;

  /// wraps one chain object into registry document
  static std::string registryOf(const std::string &chain) {
    return R"({"chains": [)" + chain + "]}";
  }
};

/**
 * @given registry document with EVM and Cosmos chains
 * @when load it
 * @then formats and derivations are read with defaults applied
 */
TEST_F(RegistryLoaderTest, LoadChains) {
  auto json = R"({
    "chains": [
      {
        "id": "ethereum",
        "name": "Ethereum",
        "group": "evm",
        "primary": true,
        "formats": [{"encoding": "hex", "length": 20}],
        "derivations": [{
          "key_type": "secp256k1",
          "steps": [{"serialize": "xy"}, {"hash": "keccak256"},
                    {"take_last": 20}],
          "encoder": {"type": "eip55"}
        }]
      },
      {
        "id": "cosmos-hub",
        "formats": [{"encoding": "bech32", "hrps": ["cosmos"],
                     "min_length": 20, "max_length": 32}],
        "derivations": [{
          "key_type": "ed25519",
          "steps": [{"serialize": "raw"}, {"hash": "sha256"},
                    {"take_first": 20}, {"prepend": "00"}],
          "encoder": {"type": "bech32", "hrp": "cosmos"}
        }]
      }
    ]
  })";

  EXPECT_OUTCOME_TRUE(registry, RegistryLoader::loadFromString(json));
  ASSERT_EQ(registry->chains().size(), 2);

  auto &ethereum = registry->chains()[0];
  EXPECT_EQ(ethereum.name, "Ethereum");
  EXPECT_EQ(ethereum.group, "evm");
  EXPECT_TRUE(ethereum.primary);
  ASSERT_EQ(ethereum.formats.size(), 1);
  auto hex = std::get_if<HexFormat>(&ethereum.formats[0]);
  ASSERT_NE(hex, nullptr);
  EXPECT_TRUE(hex->require_0x_prefix);
  EXPECT_EQ(hex->length, 20);
  auto secp = ethereum.derivationFor(KeyType::SECP256K1);
  ASSERT_NE(secp, nullptr);
  ASSERT_EQ(secp->steps.size(), 3);
  EXPECT_TRUE(std::holds_alternative<step::TakeLast>(secp->steps[2]));
  EXPECT_TRUE(std::holds_alternative<encoder::Eip55>(secp->encoder));

  auto &cosmos = registry->chains()[1];
  EXPECT_EQ(cosmos.name, "cosmos-hub");
  EXPECT_EQ(cosmos.group, "cosmos-hub");
  EXPECT_FALSE(cosmos.primary);
  auto bech32 = std::get_if<Bech32Format>(&cosmos.formats[0]);
  ASSERT_NE(bech32, nullptr);
  EXPECT_EQ(bech32->hrps, std::vector<std::string>{"cosmos"});
  EXPECT_EQ(bech32->max_length, 32);
  EXPECT_FALSE(bech32->segwit);
  auto ed25519 = cosmos.derivationFor(KeyType::ED25519);
  ASSERT_NE(ed25519, nullptr);
  auto prepend = std::get_if<step::Prepend>(&ed25519->steps[3]);
  ASSERT_NE(prepend, nullptr);
  EXPECT_EQ(prepend->bytes, foxchain::common::Buffer{0x00});
  auto bech32_encoder = std::get_if<encoder::Bech32>(&ed25519->encoder);
  ASSERT_NE(bech32_encoder, nullptr);
  EXPECT_EQ(bech32_encoder->hrp, "cosmos");
}

/**
 * @given chain with Base58Check and SS58 formats
 * @when load it
 * @then version bytes and account lengths are read
 */
TEST_F(RegistryLoaderTest, LoadVersionsAndPrefixes) {
  auto json = registryOf(R"({
    "id": "mixed",
    "formats": [
      {"encoding": "base58check",
       "versions": [{"value": 0, "kind": "P2PKH"}, {"value": 5}]},
      {"encoding": "ss58", "prefix": 136, "account_lengths": [32, 33]}
    ]
  })");

  EXPECT_OUTCOME_TRUE(registry, RegistryLoader::loadFromString(json));
  auto &chain = registry->chains().front();
  ASSERT_EQ(chain.formats.size(), 2);

  auto base58check = std::get_if<Base58CheckFormat>(&chain.formats[0]);
  ASSERT_NE(base58check, nullptr);
  ASSERT_EQ(base58check->versions.size(), 2);
  EXPECT_EQ(base58check->versions[0].kind, "P2PKH");
  EXPECT_EQ(base58check->versions[1].value, 5);
  EXPECT_EQ(base58check->payload_length, 20);

  auto ss58 = std::get_if<Ss58Format>(&chain.formats[1]);
  ASSERT_NE(ss58, nullptr);
  EXPECT_EQ(ss58->prefix, 136);
  EXPECT_EQ(ss58->account_lengths, (std::vector<size_t>{32, 33}));
  EXPECT_TRUE(chain.derivations.empty());
}

/**
 * @given malformed JSON and missing file
 * @when load them
 * @then PARSER_ERROR is returned
 */
TEST_F(RegistryLoaderTest, ParserError) {
  EXPECT_EC(RegistryLoader::loadFromString("{\"chains\": ["),
            Error::PARSER_ERROR);
  EXPECT_EC(RegistryLoader::loadFrom("/nonexistent/registry.json"),
            Error::PARSER_ERROR);
}

/**
 * @given documents without required entries
 * @when load them
 * @then MISSING_ENTRY is returned
 */
TEST_F(RegistryLoaderTest, MissingEntry) {
  EXPECT_EC(RegistryLoader::loadFromString("{}"), Error::MISSING_ENTRY);
  EXPECT_EC(RegistryLoader::loadFromString(registryOf(R"({"formats": []})")),
            Error::MISSING_ENTRY);
  EXPECT_EC(RegistryLoader::loadFromString(registryOf(R"({"id": "a"})")),
            Error::MISSING_ENTRY);
  EXPECT_EC(RegistryLoader::loadFromString(registryOf(
                R"({"id": "a", "formats": [{"encoding": "ss58"}]})")),
            Error::MISSING_ENTRY);
}

/**
 * @given documents with unknown names
 * @when load them
 * @then the kind of the unknown entry is reported
 */
TEST_F(RegistryLoaderTest, UnknownNames) {
  EXPECT_EC(RegistryLoader::loadFromString(registryOf(
                R"({"id": "a", "formats": [{"encoding": "base64"}]})")),
            Error::UNKNOWN_ENCODING);

  auto with_derivation = [&](const std::string &derivation) {
    return RegistryLoader::loadFromString(
        registryOf(R"({"id": "a", "formats": [{"encoding": "base58"}],
                       "derivations": [)"
                   + derivation + "]}"));
  };
  EXPECT_EC(with_derivation(R"({"key_type": "sr25519", "steps": [],
                               "encoder": {"type": "base58"}})"),
            Error::UNKNOWN_KEY_TYPE);
  EXPECT_EC(with_derivation(R"({"key_type": "ed25519",
                               "steps": [{"rotate": 1}],
                               "encoder": {"type": "base58"}})"),
            Error::UNKNOWN_STEP);
  EXPECT_EC(with_derivation(R"({"key_type": "ed25519",
                               "steps": [{"serialize": "raw"}],
                               "encoder": {"type": "base64"}})"),
            Error::UNKNOWN_ENCODING);
}

/**
 * @given documents with values of wrong shape
 * @when load them
 * @then INVALID_VALUE is returned
 */
TEST_F(RegistryLoaderTest, InvalidValue) {
  EXPECT_EC(RegistryLoader::loadFromString(registryOf(
                R"({"id": "a", "primary": "sure",
                    "formats": [{"encoding": "base58"}]})")),
            Error::INVALID_VALUE);
  EXPECT_EC(RegistryLoader::loadFromString(registryOf(
                R"({"id": "a", "formats": [{"encoding": "base58check",
                    "versions": [{"value": 256}]}]})")),
            Error::INVALID_VALUE);
  EXPECT_EC(RegistryLoader::loadFromString(registryOf(
                R"({"id": "a", "formats": [{"encoding": "base58"}],
                    "derivations": [{"key_type": "ed25519",
                      "steps": [{"hash": "md5"}],
                      "encoder": {"type": "base58"}}]})")),
            Error::INVALID_VALUE);
  EXPECT_EC(RegistryLoader::loadFromString(registryOf(
                R"({"id": "a", "formats": [{"encoding": "base58"}],
                    "derivations": [{"key_type": "ed25519",
                      "steps": [{"prepend": "xyz"}],
                      "encoder": {"type": "base58"}}]})")),
            Error::INVALID_VALUE);
}

/**
 * @given well-formed document with inconsistent chains
 * @when load it
 * @then registry validation error is propagated
 */
TEST_F(RegistryLoaderTest, InconsistentRegistry) {
  auto chain = R"({"id": "a", "formats": [{"encoding": "base58"}]})";
  EXPECT_EC(RegistryLoader::loadFromString(
                R"({"chains": [)" + std::string(chain) + "," + chain + "]}"),
            ChainRegistryError::DUPLICATE_CHAIN_ID);
  EXPECT_EC(RegistryLoader::loadFromString(
                registryOf(R"({"id": "a", "formats": []})")),
            ChainRegistryError::MISSING_ADDRESS_FORMAT);
}
