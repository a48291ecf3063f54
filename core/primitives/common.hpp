/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>

#include "common/blob.hpp"

namespace dynpoa::primitives {

  /// Index of a fixed-length time window since genesis, 0 is genesis slot
  using SlotNumber = uint64_t;

  /// Unique case-sensitive name of an authority
  using AuthorityId = std::string;

  using AuthorityWeight = uint64_t;

  using BlockHash = common::Hash256;

}  // namespace dynpoa::primitives
