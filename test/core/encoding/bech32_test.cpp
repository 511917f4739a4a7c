/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "encoding/bech32.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using foxchain::common::Buffer;
using foxchain::encoding::Bech32Error;
using foxchain::encoding::ConvertBitsError;
using foxchain::encoding::convertBits;
using foxchain::encoding::joinBech32;
using foxchain::encoding::splitBech32;

/**
 * @given uppercase Bech32 string
 * @when split it
 * @then HRP is lowercase and values are charset indices, checksum included
 */
TEST(Bech32Encoding, SplitUppercase) {
  EXPECT_OUTCOME_TRUE(parts, splitBech32("A12UEL5L"));
  EXPECT_EQ(parts.hrp, "a");
  // "2uel5l"
  EXPECT_EQ(parts.values, (Buffer{10, 28, 25, 31, 20, 31}));
}

/**
 * @given HRP and 5-bit values
 * @when join and split them back
 * @then the same HRP and values are returned
 */
TEST(Bech32Encoding, JoinThenSplit) {
  Buffer values{0, 14, 20, 15, 7, 13, 26};
  auto str = joinBech32("bc", values);
  EXPECT_EQ(str, "bc1qw508d6");
  EXPECT_OUTCOME_TRUE(parts, splitBech32(str));
  EXPECT_EQ(parts.hrp, "bc");
  EXPECT_EQ(parts.values, values);
}

/**
 * @given malformed Bech32 strings
 * @when split them
 * @then every malformation is reported with its own error
 */
TEST(Bech32Encoding, SplitErrors) {
  EXPECT_EC(splitBech32("A12uEL5L"), Bech32Error::MIXED_CASE);
  EXPECT_EC(splitBech32("abcdef"), Bech32Error::MISSING_SEPARATOR);
  EXPECT_EC(splitBech32("12uel5l"), Bech32Error::INVALID_HRP);
  EXPECT_EC(splitBech32(" 1qqqqqq"), Bech32Error::INVALID_HRP);
  EXPECT_EC(splitBech32("a12uel5"), Bech32Error::TOO_SHORT);
  EXPECT_EC(splitBech32("a1b2uel5l"), Bech32Error::INVALID_CHARACTER);
  EXPECT_EC(splitBech32("a1" + std::string(89, 'q')), Bech32Error::TOO_LONG);
}

/**
 * @given string longer than 90 characters
 * @when split it with raised length limit
 * @then it is accepted
 */
TEST(Bech32Encoding, ExtendedLength) {
  auto str = "addr1" + std::string(200, 'q');
  EXPECT_OUTCOME_TRUE(
      parts,
      splitBech32(str, foxchain::encoding::kBech32ExtendedMaxLength));
  EXPECT_EQ(parts.hrp, "addr");
  EXPECT_EQ(parts.values.size(), 200);
}

/**
 * @given bytes
 * @when regroup them into 5-bit values with padding and back without it
 * @then the original bytes are restored
 */
TEST(ConvertBits, RegroupAndBack) {
  EXPECT_OUTCOME_TRUE(five, convertBits(Buffer{0xff}, 8, 5, true));
  EXPECT_EQ(five, (Buffer{31, 28}));
  EXPECT_OUTCOME_TRUE(eight, convertBits(five, 5, 8, false));
  EXPECT_EQ(eight, (Buffer{0xff}));
}

/**
 * @given 5-bit values whose leftover bits are not zero
 * @when regroup them without padding
 * @then NON_ZERO_PADDING is returned
 */
TEST(ConvertBits, NonZeroPadding) {
  EXPECT_EC(convertBits(Buffer{31, 29}, 5, 8, false),
            ConvertBitsError::NON_ZERO_PADDING);
}

/**
 * @given 5-bit values leaving a whole group of padding
 * @when regroup them without padding
 * @then EXCESS_PADDING is returned
 */
TEST(ConvertBits, ExcessPadding) {
  EXPECT_EC(convertBits(Buffer{31, 28, 0}, 5, 8, false),
            ConvertBitsError::EXCESS_PADDING);
}

/**
 * @given value wider than the source bit width, and impossible widths
 * @when regroup them
 * @then the conversion is refused
 */
TEST(ConvertBits, InvalidInput) {
  EXPECT_EC(convertBits(Buffer{32}, 5, 8, false),
            ConvertBitsError::VALUE_OUT_OF_RANGE);
  EXPECT_EC(convertBits(Buffer{1}, 0, 8, true),
            ConvertBitsError::INVALID_BIT_WIDTH);
  EXPECT_EC(convertBits(Buffer{1}, 8, 9, true),
            ConvertBitsError::INVALID_BIT_WIDTH);
}
