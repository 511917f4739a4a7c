/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>

#include "common/buffer_view.hpp"
#include "common/hexutil.hpp"

namespace foxchain::common {

  /**
   * Base type which represents blob of fixed size.
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
    using Array = std::array<uint8_t, size_>;

   public:
    constexpr Blob() : Array{} {}

    constexpr explicit Blob(const Array &l) : Array{l} {}

    /**
     * In compile-time returns size of current blob.
     */
    static constexpr size_t size() {
      return size_;
    }

    BufferView view() const {
      return {this->data(), size_};
    }

    /**
     * Converts current blob to hex string.
     */
    std::string toHex() const {
      return hex_lower(view());
    }
  };

  using Hash160 = Blob<20>;
  using Hash256 = Blob<32>;
  using Hash512 = Blob<64>;

}  // namespace foxchain::common
