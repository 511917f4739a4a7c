/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <gtest/gtest.h>

#include "common/buffer.hpp"
#include "testutil/outcome.hpp"

using namespace foxchain::common;
using namespace std::string_literals;

/**
 * @given Array of bytes
 * @when hex it
 * @then hex matches expected lowercase encoding
 */
TEST(Common, Hexutil_Hex) {
  std::vector<uint8_t> bin{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xff};
  ASSERT_EQ(hex_lower(bin), "00010204081020ff"s);
  ASSERT_EQ(hex_lower_0x(bin), "0x00010204081020ff"s);
}

/**
 * @given Hexencoded string of even length, mixed case
 * @when unhex
 * @then result matches expected value
 */
TEST(Common, Hexutil_UnhexEven) {
  EXPECT_OUTCOME_TRUE(actual, unhex("00010204081020fF"));
  std::vector<uint8_t> expected{0x00, 0x01, 0x02, 0x04, 0x08, 0x10, 0x20, 0xff};
  ASSERT_EQ(actual, expected);
}

/**
 * @given Hexencoded string of odd length
 * @when unhex
 * @then unhex result contains error
 */
TEST(Common, Hexutil_UnhexOdd) {
  EXPECT_EC(unhex("0"), UnhexError::NOT_ENOUGH_INPUT);
}

/**
 * @given Hexencoded string with non-hex letter
 * @when unhex
 * @then unhex result contains error
 */
TEST(Common, Hexutil_UnhexInvalid) {
  EXPECT_EC(unhex("keks"), UnhexError::NON_HEX_INPUT);
}

/**
 * @given strings of hex digits and strings with other characters
 * @when check them for hex digits
 * @then only pure hex digits of any case pass
 */
TEST(Common, Hexutil_IsHexDigits) {
  EXPECT_TRUE(isHexDigits("0123456789abcdefABCDEF"));
  EXPECT_TRUE(isHexDigits(""));
  EXPECT_FALSE(isHexDigits("0x12"));
  EXPECT_FALSE(isHexDigits("12 34"));
}

/**
 * @given hex string
 * @when build buffer of it and hex it back
 * @then the original string is returned in lowercase
 */
TEST(Common, Hexutil_BufferFromHex) {
  EXPECT_OUTCOME_TRUE(buffer, Buffer::fromHex("DEADbeef"));
  EXPECT_EQ(buffer.size(), 4);
  EXPECT_EQ(buffer.toHex(), "deadbeef");
  EXPECT_EC(Buffer::fromHex("dead0"), UnhexError::NOT_ENOUGH_INPUT);
}
