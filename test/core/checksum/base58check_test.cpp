/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "checksum/base58check.hpp"

#include <gtest/gtest.h>

#include "crypto/hasher/hasher_impl.hpp"
#include "encoding/base58.hpp"
#include "testutil/outcome.hpp"

using foxchain::checksum::Base58CheckError;
using foxchain::checksum::decodeBase58Check;
using foxchain::checksum::encodeBase58Check;
using foxchain::common::Buffer;
using foxchain::crypto::HasherImpl;

using namespace foxchain::common::literals;

class Base58CheckTest : public testing::Test {
 protected:
  HasherImpl hasher;

  // address receiving the Bitcoin genesis coinbase
  static constexpr auto kGenesis = "1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa";
  Buffer genesis_payload =
      "0062e907b15cbf27d5425399ebf6f0fb50ebb88f18"_hex2buf;
};

/**
 * @given P2PKH address
 * @when decode it
 * @then version byte and hash160 are returned without checksum
 */
TEST_F(Base58CheckTest, Decode) {
  EXPECT_OUTCOME_TRUE(payload, decodeBase58Check(kGenesis, hasher));
  EXPECT_EQ(payload, genesis_payload);
}

/**
 * @given version byte with hash160
 * @when encode it
 * @then the known address is returned
 */
TEST_F(Base58CheckTest, Encode) {
  EXPECT_EQ(encodeBase58Check(genesis_payload, hasher), kGenesis);
}

/**
 * @given address with its last character changed
 * @when decode it
 * @then checksum does not match
 */
TEST_F(Base58CheckTest, CorruptedChecksum) {
  EXPECT_EC(decodeBase58Check("1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNb", hasher),
            Base58CheckError::CHECKSUM_MISMATCH);
}

/**
 * @given string decoding to fewer bytes than a checksum
 * @when decode it
 * @then TOO_SHORT is returned
 */
TEST_F(Base58CheckTest, TooShort) {
  EXPECT_EC(decodeBase58Check("111", hasher), Base58CheckError::TOO_SHORT);
}

/**
 * @given string with character outside Base58 alphabet
 * @when decode it
 * @then Base58 error is propagated
 */
TEST_F(Base58CheckTest, InvalidCharacter) {
  EXPECT_EC(decodeBase58Check("1A1zP1eP5QGefi2D0", hasher),
            foxchain::encoding::Base58Error::INVALID_CHARACTER);
}
