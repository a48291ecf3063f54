/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

#include "primitives/common.hpp"
#include "primitives/timestamp.hpp"

namespace dynpoa::consensus {

  /// Consensus uses system clock's time points
  using TimePoint = primitives::Timestamp;

  /// Consensus time quantum
  using Duration = std::chrono::microseconds;

  /// slot number of the block production
  using SlotNumber = primitives::SlotNumber;

}  // namespace dynpoa::consensus
