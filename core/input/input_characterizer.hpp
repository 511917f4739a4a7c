/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <string_view>

#include "input/input_signature.hpp"

namespace foxchain::input {

  /// longest input that is decoded
  inline constexpr size_t kMaxInputLength = 1023;

  /**
   * Collects structural facts of {@param raw} input. A family is listed when
   * the input is syntactically compatible with it, so one input may list
   * several families or none. Input longer than kMaxInputLength after
   * trimming is not decoded.
   */
  InputSignature characterize(std::string_view raw);

}  // namespace foxchain::input
