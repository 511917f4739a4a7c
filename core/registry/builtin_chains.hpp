/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "registry/chain_descriptor.hpp"

namespace foxchain::registry {

  /**
   * Descriptors of chains known out of the box, in ranking tie-break order
   */
  std::vector<ChainDescriptor> builtinChains();

}  // namespace foxchain::registry
