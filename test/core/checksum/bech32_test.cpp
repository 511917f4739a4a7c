/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "checksum/bech32.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using foxchain::checksum::Bech32ChecksumError;
using foxchain::checksum::Bech32Variant;
using foxchain::checksum::decodeBech32;
using foxchain::checksum::encodeBech32;
using foxchain::common::Buffer;

/**
 * @given valid BIP-173 strings of both cases
 * @when decode them
 * @then Bech32 variant with lowercase HRP is detected
 */
TEST(Bech32Checksum, DecodeBech32) {
  for (auto str : {"A12UEL5L", "a12uel5l"}) {
    EXPECT_OUTCOME_TRUE(decoded, decodeBech32(str));
    EXPECT_EQ(decoded.hrp, "a");
    EXPECT_TRUE(decoded.data.empty());
    EXPECT_EQ(decoded.variant, Bech32Variant::BECH32);
  }

  EXPECT_OUTCOME_TRUE(
      charset,
      decodeBech32("abcdef1qpzry9x8gf2tvdw0s3jn54khce6mua7lmqqqxw"));
  EXPECT_EQ(charset.hrp, "abcdef");
  ASSERT_EQ(charset.data.size(), 32);
  for (size_t i = 0; i < charset.data.size(); ++i) {
    EXPECT_EQ(charset.data[i], i);
  }
}

/**
 * @given valid BIP-350 strings
 * @when decode them
 * @then Bech32m variant is detected
 */
TEST(Bech32Checksum, DecodeBech32m) {
  for (auto str : {"A1LQFN3A", "a1lqfn3a"}) {
    EXPECT_OUTCOME_TRUE(decoded, decodeBech32(str));
    EXPECT_EQ(decoded.hrp, "a");
    EXPECT_EQ(decoded.variant, Bech32Variant::BECH32M);
  }
}

/**
 * @given HRP with empty data
 * @when encode it with each variant
 * @then the reference strings are produced
 */
TEST(Bech32Checksum, Encode) {
  EXPECT_EQ(encodeBech32("a", Buffer{}), "a12uel5l");
  EXPECT_EQ(encodeBech32("a", Buffer{}, Bech32Variant::BECH32M), "a1lqfn3a");
}

/**
 * @given string with its last character changed
 * @when decode it
 * @then INVALID_CHECKSUM is returned
 */
TEST(Bech32Checksum, CorruptedChecksum) {
  EXPECT_EC(decodeBech32("a12uel5m"), Bech32ChecksumError::INVALID_CHECKSUM);
}

/**
 * @given structurally broken string
 * @when decode it
 * @then splitting error is propagated before any checksum check
 */
TEST(Bech32Checksum, MalformedString) {
  EXPECT_EC(decodeBech32("A12uEL5L"),
            foxchain::encoding::Bech32Error::MIXED_CASE);
}
