/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <span>

#include <boost/multiprecision/cpp_int.hpp>

namespace foxchain::common {

  using uint256_t = boost::multiprecision::uint256_t;
  using uint512_t = boost::multiprecision::uint512_t;

  std::array<uint8_t, 32> uint256_to_be_bytes(const uint256_t &i);
  uint256_t be_bytes_to_uint256(std::span<const uint8_t, 32> bytes);

}  // namespace foxchain::common
