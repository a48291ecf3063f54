/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "outcome/outcome.hpp"
#include "primitives/authority.hpp"

namespace dynpoa::authority {

  /**
   * @brief Append-only log of authority sets. Each entry holds the full
   * sorted authority list (active and inactive) which is effective starting
   * from its slot until the slot of the next entry. Recorded lists are never
   * mutated afterwards.
   */
  class AuthorityHistory {
   public:
    struct Entry {
      primitives::SlotNumber start_slot{};
      std::shared_ptr<const primitives::AuthorityList> authorities;
    };

    /**
     * Stores {@param authorities} effective from {@param start_slot}. An entry
     * with the same start slot is replaced, so several edits made before the
     * next block is accepted collapse into one snapshot.
     */
    void record(primitives::SlotNumber start_slot,
                primitives::AuthorityList authorities);

    /**
     * @return authority list of the latest entry whose start slot is not
     * greater than {@param slot}
     */
    outcome::result<std::shared_ptr<const primitives::AuthorityList>>
    effectiveAt(primitives::SlotNumber slot) const;

    /**
     * @return copy of authority {@param id} as it was recorded in the list
     * effective at {@param slot}
     */
    outcome::result<primitives::Authority> authorityAt(
        primitives::SlotNumber slot, std::string_view id) const;

    const std::vector<Entry> &entries() const {
      return entries_;
    }

    bool empty() const {
      return entries_.empty();
    }

    /// Replace-if-same-slot then sort by start slot
    static std::vector<Entry> merge(std::vector<Entry> entries, Entry entry);

   private:
    std::vector<Entry> entries_;
  };

}  // namespace dynpoa::authority
