/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/authority/authority_history.hpp"
#include "outcome/outcome.hpp"
#include "primitives/authority.hpp"

namespace dynpoa::consensus::poa {

  /**
   * Weighted round-robin leader of {@param slot}. Active entries of
   * {@param authorities} (sorted by id) form a cycle of total weight W,
   * where each authority owns a run of `weight` consecutive positions.
   * Slot N maps to position (N - 1) mod W.
   * @return leader, INVALID_SLOT for slot 0, NO_ACTIVE_AUTHORITIES, or
   * WEIGHT_OVERFLOW if W does not fit 64 bits
   */
  outcome::result<primitives::Authority> slotLeader(
      primitives::SlotNumber slot, const primitives::AuthorityList &authorities);

  /**
   * Leader of {@param slot} according to the authority set which was
   * effective at that slot
   * @return leader, INVALID_SLOT for slot 0 or a slot preceding the whole
   * history, NO_ACTIVE_AUTHORITIES
   */
  outcome::result<primitives::Authority> authorityForSlot(
      primitives::SlotNumber slot, const authority::AuthorityHistory &history);

}  // namespace dynpoa::consensus::poa
