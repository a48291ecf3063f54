/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/poa/leader_schedule.hpp"

#include <algorithm>
#include <limits>

#include <boost/assert.hpp>
#include <boost/config.hpp>

#include "consensus/poa/poa_error.hpp"

namespace dynpoa::consensus::poa {

  outcome::result<primitives::Authority> slotLeader(
      primitives::SlotNumber slot,
      const primitives::AuthorityList &authorities) {
    if (slot == 0) {
      return PoaError::INVALID_SLOT;
    }
    BOOST_ASSERT(std::is_sorted(
        authorities.begin(),
        authorities.end(),
        [](const auto &l, const auto &r) { return l.id < r.id; }));

    constexpr auto kMaxWeight =
        std::numeric_limits<primitives::AuthorityWeight>::max();
    primitives::AuthorityWeight total_weight = 0;
    for (const auto &authority : authorities) {
      if (not authority.active) {
        continue;
      }
      if (authority.weight > kMaxWeight - total_weight) {
        return PoaError::WEIGHT_OVERFLOW;
      }
      total_weight += authority.weight;
    }
    if (total_weight == 0) {
      return PoaError::NO_ACTIVE_AUTHORITIES;
    }

    const auto position = (slot - 1) % total_weight;
    primitives::AuthorityWeight cumulative = 0;
    for (const auto &authority : authorities) {
      if (not authority.active) {
        continue;
      }
      cumulative += authority.weight;
      if (position < cumulative) {
        return authority;
      }
    }
    BOOST_ASSERT_MSG(false, "position is always below total weight");
    BOOST_UNREACHABLE_RETURN(PoaError::NO_ACTIVE_AUTHORITIES);
  }

  outcome::result<primitives::Authority> authorityForSlot(
      primitives::SlotNumber slot, const authority::AuthorityHistory &history) {
    if (slot == 0) {
      return PoaError::INVALID_SLOT;
    }
    auto authorities_res = history.effectiveAt(slot);
    if (authorities_res.has_error()) {
      return PoaError::INVALID_SLOT;
    }
    return slotLeader(slot, *authorities_res.value());
  }

}  // namespace dynpoa::consensus::poa
