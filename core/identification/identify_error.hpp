/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>
#include <vector>

#include "outcome/outcome.hpp"

namespace foxchain::identification {

  /**
   * Reasons identification fails; the error message is the reason string
   */
  enum class IdentifyError {
    EMPTY_INPUT = 1,
    UNRECOGNIZED_FORMAT,
    INVALID_ENCODING,
    INVALID_LENGTH,
    UNSUPPORTED_PREFIX,
    CHECKSUM_MISMATCH,
    INVALID_PUBLIC_KEY,
    DERIVATION_NOT_IMPLEMENTED,
  };

  enum class ErrorKind {
    /// no known encoding or chain accepts the input
    INVALID_INPUT,
    /// input is a known key class, but no chain derives an address from it
    NOT_IMPLEMENTED,
  };

  ErrorKind errorKind(IdentifyError error);

  /**
   * Translates error of encoding, checksum, curve or resolution layer into
   * the reason reported to callers
   */
  IdentifyError toIdentifyError(const std::error_code &ec);

  /**
   * @return the most specific reason among {@param rejections}, or
   * UNRECOGNIZED_FORMAT if there are none
   */
  IdentifyError mostSpecific(const std::vector<std::error_code> &rejections);

}  // namespace foxchain::identification

OUTCOME_HPP_DECLARE_ERROR(foxchain::identification, IdentifyError);
