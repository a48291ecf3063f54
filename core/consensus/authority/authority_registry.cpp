/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/authority/authority_registry.hpp"

#include <limits>

#include <boost/algorithm/string/trim.hpp>

#include "consensus/authority/authority_registry_error.hpp"

namespace dynpoa::authority {

  outcome::result<primitives::AuthorityId> normalizeIdentifier(
      std::string_view id) {
    auto trimmed = boost::algorithm::trim_copy(std::string{id});
    if (trimmed.empty()) {
      return AuthorityRegistryError::EMPTY_IDENTIFIER;
    }
    return trimmed;
  }

  outcome::result<primitives::Authority> normalizeAuthority(
      primitives::Authority authority) {
    OUTCOME_TRY(id, normalizeIdentifier(authority.id));
    authority.id = std::move(id);
    boost::algorithm::trim(authority.secret);
    if (authority.secret.empty()) {
      return AuthorityRegistryError::EMPTY_SECRET;
    }
    if (authority.weight < 1) {
      return AuthorityRegistryError::INVALID_WEIGHT;
    }
    return authority;
  }

  AuthorityRegistry::AuthorityRegistry()
      : log_{log::createLogger("AuthorityRegistry", "authority")} {}

  outcome::result<primitives::Authority> AuthorityRegistry::registerAuthority(
      primitives::Authority authority,
      bool overwrite,
      primitives::SlotNumber effective_from) {
    OUTCOME_TRY(normalized, normalizeAuthority(std::move(authority)));
    auto it = authorities_.find(normalized.id);
    if (it != authorities_.end() and not overwrite) {
      return AuthorityRegistryError::DUPLICATE_AUTHORITY;
    }
    if (not activeWeightFits(normalized)) {
      return AuthorityRegistryError::INVALID_WEIGHT;
    }
    if (it != authorities_.end()) {
      it->second = normalized;
    } else {
      authorities_.emplace(normalized.id, normalized);
    }
    SL_DEBUG(log_,
             "Authority {} registered (weight={}, active={}), effective from "
             "slot {}",
             normalized.id,
             normalized.weight,
             normalized.active,
             effective_from);
    recordSnapshot(effective_from);
    return normalized;
  }

  outcome::result<primitives::Authority>
  AuthorityRegistry::deregisterAuthority(
      std::string_view id, primitives::SlotNumber effective_from) {
    OUTCOME_TRY(normalized_id, normalizeIdentifier(id));
    auto it = authorities_.find(normalized_id);
    if (it == authorities_.end()) {
      return AuthorityRegistryError::UNKNOWN_AUTHORITY;
    }
    auto removed = std::move(it->second);
    authorities_.erase(it);
    SL_DEBUG(log_,
             "Authority {} deregistered, effective from slot {}",
             removed.id,
             effective_from);
    recordSnapshot(effective_from);
    return removed;
  }

  outcome::result<primitives::Authority> AuthorityRegistry::updateAuthority(
      std::string_view id,
      const AuthorityUpdate &update,
      primitives::SlotNumber effective_from) {
    OUTCOME_TRY(normalized_id, normalizeIdentifier(id));
    auto it = authorities_.find(normalized_id);
    if (it == authorities_.end()) {
      return AuthorityRegistryError::UNKNOWN_AUTHORITY;
    }

    // validate on a copy, so failed update leaves authority untouched
    auto updated = it->second;
    if (update.secret.has_value()) {
      updated.secret = update.secret.value();
    }
    if (update.weight.has_value()) {
      updated.weight = update.weight.value();
    }
    if (update.active.has_value()) {
      updated.active = update.active.value();
    }
    if (update.metadata.has_value()) {
      updated.metadata = update.metadata.value();
    }
    OUTCOME_TRY(normalized, normalizeAuthority(std::move(updated)));
    if (not activeWeightFits(normalized)) {
      return AuthorityRegistryError::INVALID_WEIGHT;
    }

    it->second = std::move(normalized);
    SL_DEBUG(log_,
             "Authority {} updated (weight={}, active={}), effective from "
             "slot {}",
             it->second.id,
             it->second.weight,
             it->second.active,
             effective_from);
    recordSnapshot(effective_from);
    return it->second;
  }

  bool AuthorityRegistry::activeWeightFits(
      const primitives::Authority &candidate) const {
    constexpr auto kMax = std::numeric_limits<primitives::AuthorityWeight>::max();
    primitives::AuthorityWeight total = candidate.active ? candidate.weight : 0;
    for (const auto &[id, authority] : authorities_) {
      if (id == candidate.id or not authority.active) {
        continue;
      }
      if (authority.weight > kMax - total) {
        return false;
      }
      total += authority.weight;
    }
    return true;
  }

  void AuthorityRegistry::recordSnapshot(
      primitives::SlotNumber effective_from) {
    history_.record(effective_from, authorities());
    SL_TRACE(log_,
             "Snapshot of {} authorities recorded at slot {}",
             authorities_.size(),
             effective_from);
  }

  std::optional<primitives::Authority> AuthorityRegistry::find(
      std::string_view id) const {
    auto it = authorities_.find(boost::algorithm::trim_copy(std::string{id}));
    if (it == authorities_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  primitives::AuthorityList AuthorityRegistry::authorities() const {
    primitives::AuthorityList list;
    list.reserve(authorities_.size());
    for (const auto &[id, authority] : authorities_) {
      list.emplace_back(authority);
    }
    return list;
  }

  primitives::AuthorityList AuthorityRegistry::activeAuthorities() const {
    primitives::AuthorityList list;
    for (const auto &[id, authority] : authorities_) {
      if (authority.active) {
        list.emplace_back(authority);
      }
    }
    return list;
  }

}  // namespace dynpoa::authority
