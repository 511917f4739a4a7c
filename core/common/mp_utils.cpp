/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/mp_utils.hpp"

namespace foxchain::common {

  namespace {
    template <size_t size, typename uint>
    inline std::array<uint8_t, size> uint_to_be_bytes(const uint &i) {
      std::array<uint8_t, size> res{};
      res.fill(0);
      export_bits(i, res.rbegin(), 8, false);
      return res;
    }

    template <size_t size, typename uint>
    inline uint be_bytes_to_uint(std::span<const uint8_t, size> bytes) {
      uint result;
      import_bits(result, bytes.rbegin(), bytes.rend(), 8, false);
      return result;
    }
  }  // namespace

  std::array<uint8_t, 32> uint256_to_be_bytes(const uint256_t &i) {
    return uint_to_be_bytes<32>(i);
  }

  uint256_t be_bytes_to_uint256(std::span<const uint8_t, 32> bytes) {
    return be_bytes_to_uint<32, uint256_t>(bytes);
  }

}  // namespace foxchain::common
