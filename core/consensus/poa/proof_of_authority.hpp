/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "consensus/authority/authority_registry.hpp"
#include "consensus/poa/engine_snapshot.hpp"
#include "consensus/timeline/types.hpp"
#include "outcome/outcome.hpp"
#include "primitives/authority.hpp"
#include "primitives/block.hpp"

namespace dynpoa::consensus::poa {

  /**
   * Proof-of-Authority engine over a single chain. Known weighted
   * authorities take turns to propose blocks by a deterministic slot
   * schedule. Every block is authenticated by its proposer and linked to
   * its parent.
   *
   * Changes of the authority set take effect from the slot following the
   * last accepted block, so the history of the set is never rewritten.
   * Results are copies, the engine never shares its state.
   */
  class ProofOfAuthority {
   public:
    virtual ~ProofOfAuthority() = default;

    /**
     * Registers {@param authority}. Existing authority with the same id is
     * replaced if {@param overwrite} is set, otherwise DUPLICATE_AUTHORITY
     */
    virtual outcome::result<primitives::Authority> registerAuthority(
        primitives::Authority authority, bool overwrite) = 0;

    /// @return removed authority or UNKNOWN_AUTHORITY
    virtual outcome::result<primitives::Authority> deregisterAuthority(
        std::string_view id) = 0;

    /// @return updated authority or UNKNOWN_AUTHORITY
    virtual outcome::result<primitives::Authority> updateAuthority(
        std::string_view id, const authority::AuthorityUpdate &update) = 0;

    /// @return currently active authorities sorted by id
    virtual primitives::AuthorityList activeAuthorities() const = 0;

    /// @return all registered authorities sorted by id
    virtual primitives::AuthorityList authorities() const = 0;

    /**
     * @return leader of {@param slot} by the authority set effective at
     * that slot
     */
    virtual outcome::result<primitives::Authority> authorityForSlot(
        SlotNumber slot) const = 0;

    /**
     * @return leader of the slot containing {@param timestamp},
     * GENESIS_SLOT_RESERVED for slot 0
     */
    virtual outcome::result<primitives::Authority> expectedAuthorityAt(
        TimePoint timestamp) const = 0;

    virtual outcome::result<SlotNumber> slotForTimestamp(
        TimePoint timestamp) const = 0;

    virtual TimePoint slotStartTime(SlotNumber slot) const = 0;

    /**
     * Creates block of {@param authority_id} on top of the last block and
     * signs it. Block is not appended, use submitBlock for that.
     * @param timestamp defines the slot, current time if not set
     */
    virtual outcome::result<primitives::AuthorityBlock> createBlock(
        std::string_view authority_id,
        primitives::Payload payload,
        std::optional<TimePoint> timestamp,
        std::optional<primitives::Payload> metadata) const = 0;

    /// Verifies {@param block} as a child of the last block
    virtual outcome::result<void> verifyBlock(
        const primitives::AuthorityBlock &block) const = 0;

    /// Verifies {@param block} as a child of {@param previous}
    virtual outcome::result<void> verifyBlock(
        const primitives::AuthorityBlock &block,
        const primitives::AuthorityBlock &previous) const = 0;

    /**
     * Appends {@param block} if it verifies against the last block
     * @return accepted block or BLOCK_REJECTED, chain is unchanged then
     */
    virtual outcome::result<primitives::AuthorityBlock> submitBlock(
        primitives::AuthorityBlock block) = 0;

    /**
     * Verifies every block against its predecessor
     * @return reason of the first failure
     */
    virtual outcome::result<void> validateChain() const = 0;

    virtual std::vector<primitives::AuthorityBlock> chain() const = 0;

    virtual primitives::AuthorityBlock lastBlock() const = 0;

    virtual primitives::AuthorityBlock genesisBlock() const = 0;

    /// @return number of blocks including genesis
    virtual size_t height() const = 0;

    virtual TimePoint genesisTime() const = 0;

    virtual Duration slotDuration() const = 0;

    virtual EngineSnapshot snapshot() const = 0;
  };

}  // namespace dynpoa::consensus::poa
