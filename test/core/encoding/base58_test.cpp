/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "encoding/base58.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using foxchain::common::Buffer;
using foxchain::encoding::Base58Error;
using foxchain::encoding::decodeBase58;
using foxchain::encoding::encodeBase58;
using foxchain::encoding::isBase58Char;

constexpr size_t base58_pair_num = 13;
constexpr const char *base58_pairs[base58_pair_num][2]{
    {"", ""},
    {"61", "2g"},
    {"626262", "a3gV"},
    {"636363", "aPEr"},
    {"73696d706c792061206c6f6e6720737472696e67",
     "2cFupjhnEsSn59qHXstmK2ffpLv2"},
    {"00eb15231dfceb60925886b67d065299925915aeb172c06647",
     "1NS17iag9jJgTHD1VXjvLCEnZuQ3rJDE9L"},
    {"516b6fcd0f", "ABnLTmg"},
    {"bf4f89001e670274dd", "3SEo3LWLoPntC"},
    {"572e4794", "3EFU7m"},
    {"ecac89cad93923c02321", "EJDM8drfXA6uyA"},
    {"10c8511e", "Rt5zm"},
    {"00000000000000000000", "1111111111"},
    {"000111d38e5fc9071ffcd20b4a763cc9ae4f252bb4e48fd66a835e252ada93ff480d6dd43"
     "dc62a641155a5",
     "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz"}};

/**
 * @given Base58 strings with known byte values
 * @when decode them
 * @then the bytes match, leading '1's become leading zero bytes
 */
TEST(Base58, Decode) {
  for (auto &[hex, str] : base58_pairs) {
    EXPECT_OUTCOME_TRUE(res, decodeBase58(str));
    EXPECT_EQ(res, Buffer::fromHex(hex).value()) << str;
  }
}

/**
 * @given byte strings with known Base58 encodings
 * @when encode them
 * @then the strings match
 */
TEST(Base58, Encode) {
  for (auto &[hex, str] : base58_pairs) {
    auto ref = Buffer::fromHex(hex).value();
    EXPECT_EQ(encodeBase58(ref), str);
  }
}

/**
 * @given strings with characters outside the Base58 alphabet
 * @when decode them
 * @then INVALID_CHARACTER is returned
 */
TEST(Base58, DecodeInvalidCharacter) {
  for (auto str : {"bad0IOl", "good bad", "3vQB7B6MrGQZaxCuFg4oh0", "O", "l"}) {
    EXPECT_EC(decodeBase58(str), Base58Error::INVALID_CHARACTER);
  }
}

/**
 * @given characters excluded from the alphabet and the alphabet itself
 * @when check membership
 * @then only alphabet characters pass
 */
TEST(Base58, Alphabet) {
  for (char c : std::string_view{"0OIl+/ "}) {
    EXPECT_FALSE(isBase58Char(c)) << c;
  }
  for (char c : foxchain::encoding::kBase58Alphabet) {
    EXPECT_TRUE(isBase58Char(c)) << c;
  }
}
