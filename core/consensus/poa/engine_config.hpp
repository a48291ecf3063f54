/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <optional>

#include "consensus/timeline/types.hpp"
#include "primitives/authority.hpp"
#include "primitives/payload.hpp"

namespace dynpoa::consensus::poa {

  /**
   * Parameters of the chain, the engine is constructed from
   */
  struct EngineConfig {
    Duration slot_duration = std::chrono::seconds{5};
    /// current time of the clock, if not set
    std::optional<TimePoint> genesis_time;
    primitives::Payload genesis_payload;
    std::optional<primitives::Payload> genesis_metadata;
    /// registered before genesis, effective from slot 1
    primitives::AuthorityList authorities;
  };

}  // namespace dynpoa::consensus::poa
