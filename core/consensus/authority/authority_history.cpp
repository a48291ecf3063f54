/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/authority/authority_history.hpp"

#include <algorithm>

#include "consensus/authority/authority_registry_error.hpp"

namespace dynpoa::authority {

  std::vector<AuthorityHistory::Entry> AuthorityHistory::merge(
      std::vector<Entry> entries, Entry entry) {
    std::erase_if(entries, [&](const Entry &existing) {
      return existing.start_slot == entry.start_slot;
    });
    entries.emplace_back(std::move(entry));
    std::stable_sort(
        entries.begin(), entries.end(), [](const Entry &l, const Entry &r) {
          return l.start_slot < r.start_slot;
        });
    return entries;
  }

  void AuthorityHistory::record(primitives::SlotNumber start_slot,
                                primitives::AuthorityList authorities) {
    entries_ = merge(
        std::move(entries_),
        Entry{start_slot,
              std::make_shared<const primitives::AuthorityList>(
                  std::move(authorities))});
  }

  outcome::result<std::shared_ptr<const primitives::AuthorityList>>
  AuthorityHistory::effectiveAt(primitives::SlotNumber slot) const {
    auto it = std::upper_bound(
        entries_.begin(),
        entries_.end(),
        slot,
        [](primitives::SlotNumber s, const Entry &e) { return s < e.start_slot; });
    if (it == entries_.begin()) {
      return AuthorityRegistryError::NO_SNAPSHOT_FOR_SLOT;
    }
    return std::prev(it)->authorities;
  }

  outcome::result<primitives::Authority> AuthorityHistory::authorityAt(
      primitives::SlotNumber slot, std::string_view id) const {
    OUTCOME_TRY(authorities, effectiveAt(slot));
    auto it = std::find_if(
        authorities->begin(),
        authorities->end(),
        [&](const primitives::Authority &a) { return a.id == id; });
    if (it == authorities->end()) {
      return AuthorityRegistryError::NOT_IN_SNAPSHOT;
    }
    return *it;
  }

}  // namespace dynpoa::authority
