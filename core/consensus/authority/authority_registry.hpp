/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <optional>
#include <string_view>

#include "consensus/authority/authority_history.hpp"
#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "primitives/authority.hpp"

namespace dynpoa::authority {

  /**
   * Partial change of a registered authority, absent fields are kept
   */
  struct AuthorityUpdate {
    std::optional<std::string> secret;
    std::optional<primitives::AuthorityWeight> weight;
    std::optional<bool> active;
    std::optional<primitives::Payload> metadata;
  };

  /**
   * @return trimmed identifier or EMPTY_IDENTIFIER
   */
  outcome::result<primitives::AuthorityId> normalizeIdentifier(
      std::string_view id);

  /**
   * Trims id and secret, checks that both are non-empty and weight >= 1
   */
  outcome::result<primitives::Authority> normalizeAuthority(
      primitives::Authority authority);

  /**
   * Current set of authorities keyed by id together with history of
   * authority sets. Every successful mutation records a snapshot of the
   * whole set, effective from the slot passed by the caller.
   */
  class AuthorityRegistry {
   public:
    AuthorityRegistry();

    /**
     * Adds authority or replaces existing one when {@param overwrite} is set.
     * Registration and update fail with INVALID_WEIGHT if total weight of
     * active authorities would not fit 64 bits.
     * @return stored (normalized) authority
     */
    outcome::result<primitives::Authority> registerAuthority(
        primitives::Authority authority,
        bool overwrite,
        primitives::SlotNumber effective_from);

    /**
     * Removes authority from the live set. Snapshots recorded earlier keep
     * it, so blocks it produced before still verify.
     * @return removed authority
     */
    outcome::result<primitives::Authority> deregisterAuthority(
        std::string_view id, primitives::SlotNumber effective_from);

    outcome::result<primitives::Authority> updateAuthority(
        std::string_view id,
        const AuthorityUpdate &update,
        primitives::SlotNumber effective_from);

    /// Records the current set in history, effective from the given slot
    void recordSnapshot(primitives::SlotNumber effective_from);

    std::optional<primitives::Authority> find(std::string_view id) const;

    /// All authorities sorted by id
    primitives::AuthorityList authorities() const;

    /// Active authorities sorted by id
    primitives::AuthorityList activeAuthorities() const;

    const AuthorityHistory &history() const {
      return history_;
    }

   private:
    /// Checks that active weights stay summable once {@param candidate}
    /// replaces the authority with its id
    bool activeWeightFits(const primitives::Authority &candidate) const;

    std::map<primitives::AuthorityId, primitives::Authority, std::less<>>
        authorities_;
    AuthorityHistory history_;
    log::Logger log_;
  };

}  // namespace dynpoa::authority
