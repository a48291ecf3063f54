/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "consensus/authority/authority_history.hpp"
#include "consensus/timeline/types.hpp"
#include "primitives/authority.hpp"
#include "primitives/block.hpp"

namespace dynpoa::consensus::poa {

  /**
   * Descriptive export of the engine state for persistence or debugging.
   * It is not needed to re-verify the chain.
   */
  struct EngineSnapshot {
    TimePoint genesis_time;
    Duration slot_duration{};
    primitives::AuthorityList authorities;
    std::vector<authority::AuthorityHistory::Entry> authority_history;
    std::vector<primitives::AuthorityBlock> chain;
  };

  /**
   * Renders {@param snapshot} as JSON object with keys authorities,
   * authority_history, chain, genesis_time and slot_duration_seconds.
   * Secrets of authorities are omitted.
   */
  std::string snapshotToJson(const EngineSnapshot &snapshot,
                             bool pretty = false);

}  // namespace dynpoa::consensus::poa
