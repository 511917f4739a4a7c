/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "checksum/ss58.hpp"

#include <gtest/gtest.h>

#include "crypto/hasher/hasher_impl.hpp"
#include "encoding/ss58.hpp"
#include "testutil/outcome.hpp"

using foxchain::checksum::Ss58Error;
using foxchain::checksum::decodeSs58;
using foxchain::checksum::encodeSs58;
using foxchain::checksum::ss58ChecksumLength;
using foxchain::common::Buffer;
using foxchain::crypto::HasherImpl;

using namespace foxchain::common::literals;

class Ss58Test : public testing::Test {
 protected:
  HasherImpl hasher;

  Buffer alice =
      "d43593c715fdd31c61141abd04a99fd6822c8558854ccde39a5684e7a56da27d"_hex2buf;
};

/**
 * @given account lengths
 * @when ask for checksum length
 * @then only lengths with a defined checksum are accepted
 */
TEST_F(Ss58Test, ChecksumLength) {
  EXPECT_EQ(ss58ChecksumLength(1), 1);
  EXPECT_EQ(ss58ChecksumLength(8), 1);
  EXPECT_EQ(ss58ChecksumLength(32), 2);
  EXPECT_EQ(ss58ChecksumLength(33), 2);
  EXPECT_FALSE(ss58ChecksumLength(20).has_value());
}

/**
 * @given 32-byte accounts and one-byte prefixes
 * @when encode them
 * @then well known addresses are produced
 */
TEST_F(Ss58Test, Encode) {
  EXPECT_OUTCOME_TRUE(generic, encodeSs58(42, alice, hasher));
  EXPECT_EQ(generic, "5GrwvaEF5zXb26Fz9rcQpDWS57CtERHpNehXCPcNoHGKutQY");
  EXPECT_OUTCOME_TRUE(polkadot, encodeSs58(0, alice, hasher));
  EXPECT_EQ(polkadot, "15oF4uVJwmo4TdGW7VfQxNLavjCXviqxT9S1MgbjMNHr6Sp5");
  EXPECT_OUTCOME_TRUE(zero, encodeSs58(42, Buffer(32, 0), hasher));
  EXPECT_EQ(zero, "5C4hrfjw9DjXZTzV3MwzrrAr9P1MJhSrvWGWqi1eSuyUpnhM");
}

/**
 * @given address with two-byte prefix
 * @when decode it
 * @then prefix above 63 and account are returned
 */
TEST_F(Ss58Test, TwoBytePrefix) {
  auto account =
      "d75a980182b10ab7d54bfed3c964073a0ee172f3daa62325af021a68f707511a"_hex2buf;
  EXPECT_OUTCOME_TRUE(
      address,
      decodeSs58("VRSzSNQTU6RULpWLSn3Es9nCRFckzq5CPUcQNrkFVXpazGHmQ", hasher));
  EXPECT_EQ(address.prefix, 136);
  EXPECT_EQ(address.account, account);
  EXPECT_OUTCOME_TRUE(encoded, encodeSs58(136, account, hasher));
  EXPECT_EQ(encoded, "VRSzSNQTU6RULpWLSn3Es9nCRFckzq5CPUcQNrkFVXpazGHmQ");
}

/**
 * @given addresses of short accounts
 * @when decode them
 * @then one-byte checksum is used
 */
TEST_F(Ss58Test, ShortAccounts) {
  EXPECT_OUTCOME_TRUE(one, decodeSs58("F7Hs", hasher));
  EXPECT_EQ(one.prefix, 42);
  EXPECT_EQ(one.account, (Buffer{0x00}));
  EXPECT_OUTCOME_TRUE(eight, decodeSs58("3MsZWNhRvzMGK9", hasher));
  EXPECT_EQ(eight.account, "0102030405060708"_hex2buf);
}

/**
 * @given address with its last character changed
 * @when decode it
 * @then INVALID_CHECKSUM is returned
 */
TEST_F(Ss58Test, CorruptedChecksum) {
  EXPECT_EC(decodeSs58("5GrwvaEF5zXb26Fz9rcQpDWS57CtERHpNehXCPcNoHGKutQZ", hasher),
            Ss58Error::INVALID_CHECKSUM);
}

/**
 * @given account of a length without defined checksum
 * @when encode it
 * @then INVALID_LENGTH is returned
 */
TEST_F(Ss58Test, InvalidLength) {
  EXPECT_EC(encodeSs58(42, Buffer(20, 1), hasher), Ss58Error::INVALID_LENGTH);
  EXPECT_EC(encodeSs58(16384, alice, hasher),
            foxchain::encoding::Ss58PrefixError::PREFIX_OUT_OF_RANGE);
}
