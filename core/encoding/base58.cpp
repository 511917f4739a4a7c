/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

// BASED ON BITCOIN IMPLEMENTATION WITH THE FOLLOWING COPYRIGHT:
//
// Copyright (c) 2014-2020 The Bitcoin Core developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "encoding/base58.hpp"

#include <algorithm>
#include <array>

OUTCOME_CPP_DEFINE_CATEGORY(foxchain::encoding, Base58Error, e) {
  using E = foxchain::encoding::Base58Error;
  switch (e) {
    case E::INVALID_CHARACTER:
      return "Invalid character in a Base58 string";
  }
  return "Unknown error in base58 decoder";
}

namespace foxchain::encoding {

  namespace {
    constexpr std::array<int8_t, 256> makeBase58Map() {
      std::array<int8_t, 256> map{};
      map.fill(-1);
      for (size_t i = 0; i < kBase58Alphabet.size(); ++i) {
        map[static_cast<uint8_t>(kBase58Alphabet[i])] = static_cast<int8_t>(i);
      }
      return map;
    }

    constexpr auto mapBase58 = makeBase58Map();
  }  // namespace

  bool isBase58Char(char c) {
    return mapBase58[static_cast<uint8_t>(c)] != -1;
  }

  outcome::result<common::Buffer> decodeBase58(std::string_view str) {
    // Skip and count leading '1's.
    size_t zeroes = 0;
    while (zeroes < str.size() and str[zeroes] == '1') {
      ++zeroes;
    }
    str.remove_prefix(zeroes);

    // Allocate enough space in big-endian base256 representation.
    // log(58) / log(256), rounded up.
    const size_t size = str.size() * 733 / 1000 + 1;
    std::vector<uint8_t> b256(size);

    size_t length = 0;
    for (char ch : str) {
      int carry = mapBase58[static_cast<uint8_t>(ch)];
      if (carry == -1) {
        return Base58Error::INVALID_CHARACTER;
      }
      size_t i = 0;
      // Apply "b256 = b256 * 58 + ch".
      for (auto it = b256.rbegin();
           (carry != 0 or i < length) and (it != b256.rend());
           ++it, ++i) {
        carry += 58 * (*it);
        *it = static_cast<uint8_t>(carry % 256);
        carry /= 256;
      }
      length = i;
    }

    // Skip leading zeroes in b256.
    auto it = b256.begin() + static_cast<ptrdiff_t>(size - length);

    common::Buffer res;
    res.reserve(zeroes + (b256.end() - it));
    res.assign(zeroes, 0);
    res.insert(res.end(), it, b256.end());
    return res;
  }

  std::string encodeBase58(common::BufferView input) {
    // Skip & count leading zeroes.
    size_t zeroes = 0;
    while (not input.empty() and input[0] == 0) {
      input.dropFirst(1);
      ++zeroes;
    }

    // Allocate enough space in big-endian base58 representation.
    // log(256) / log(58), rounded up.
    const size_t size = input.size() * 138 / 100 + 1;
    std::vector<uint8_t> b58(size);

    size_t length = 0;
    for (uint8_t byte : input) {
      int carry = byte;
      size_t i = 0;
      // Apply "b58 = b58 * 256 + ch".
      for (auto it = b58.rbegin();
           (carry != 0 or i < length) and (it != b58.rend());
           ++it, ++i) {
        carry += 256 * (*it);
        *it = static_cast<uint8_t>(carry % 58);
        carry /= 58;
      }
      length = i;
    }

    // Skip leading zeroes in base58 result.
    auto it = b58.begin() + static_cast<ptrdiff_t>(size - length);
    it = std::find_if(it, b58.end(), [](auto b) { return b != 0; });

    std::string str;
    str.reserve(zeroes + (b58.end() - it));
    str.assign(zeroes, '1');
    while (it != b58.end()) {
      str += kBase58Alphabet[*(it++)];
    }
    return str;
  }

}  // namespace foxchain::encoding
