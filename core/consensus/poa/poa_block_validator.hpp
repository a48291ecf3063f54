/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "consensus/authority/authority_history.hpp"
#include "consensus/timeline/slots_util.hpp"
#include "log/logger.hpp"
#include "primitives/block.hpp"

namespace dynpoa::consensus::poa {

  /**
   * Stateless check of a block against its parent and the history of
   * authority sets. Leader and secret of the proposer are taken from the
   * set effective at the slot of the block, not from the live registry.
   */
  class PoaBlockValidator {
   public:
    enum class ValidationError {
      GENESIS_MISMATCH = 1,
      HASH_MISMATCH,
      SLOT_NOT_ADVANCING,
      PARENT_HASH_MISMATCH,
      NO_AUTHORITIES,
      UNEXPECTED_PROPOSER,
      INACTIVE_PROPOSER,
      SLOT_TIMESTAMP_MISMATCH,
      MISSING_SIGNATURE,
      INVALID_SIGNATURE,
    };

    explicit PoaBlockValidator(std::shared_ptr<const SlotsUtil> slots_util);

    /**
     * Genesis block is accepted only when it is identical to the
     * {@param genesis} of the chain and no parent is given
     */
    outcome::result<void> validateGenesis(
        const primitives::AuthorityBlock &block,
        const primitives::AuthorityBlock &genesis,
        bool has_parent) const;

    /**
     * Validates non-genesis {@param block} as a child of {@param parent}
     */
    outcome::result<void> validate(
        const primitives::AuthorityBlock &block,
        const primitives::AuthorityBlock &parent,
        const authority::AuthorityHistory &history) const;

   private:
    bool verifySignature(const primitives::AuthorityBlock &block,
                         const primitives::Authority &proposer) const;

    std::shared_ptr<const SlotsUtil> slots_util_;
    log::Logger log_;
  };

}  // namespace dynpoa::consensus::poa

OUTCOME_HPP_DECLARE_ERROR(dynpoa::consensus::poa,
                          PoaBlockValidator::ValidationError)
