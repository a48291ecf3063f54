/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/poa/proof_of_authority.hpp"

#include <memory>

#include "clock/clock.hpp"
#include "consensus/authority/authority_registry.hpp"
#include "consensus/poa/engine_config.hpp"
#include "consensus/poa/poa_block_validator.hpp"
#include "consensus/timeline/slots_util.hpp"
#include "log/logger.hpp"
#include "utils/safe_object.hpp"

namespace dynpoa::consensus::poa {

  class ProofOfAuthorityImpl final : public ProofOfAuthority {
   public:
    /**
     * Creates genesis block and registers initial authorities of
     * {@param config}
     * @param clock source of genesis time and default block timestamps
     * @return engine or configuration error
     */
    static outcome::result<std::shared_ptr<ProofOfAuthorityImpl>> create(
        EngineConfig config, std::shared_ptr<const clock::SystemClock> clock);

    outcome::result<primitives::Authority> registerAuthority(
        primitives::Authority authority, bool overwrite) override;

    outcome::result<primitives::Authority> deregisterAuthority(
        std::string_view id) override;

    outcome::result<primitives::Authority> updateAuthority(
        std::string_view id, const authority::AuthorityUpdate &update) override;

    primitives::AuthorityList activeAuthorities() const override;

    primitives::AuthorityList authorities() const override;

    outcome::result<primitives::Authority> authorityForSlot(
        SlotNumber slot) const override;

    outcome::result<primitives::Authority> expectedAuthorityAt(
        TimePoint timestamp) const override;

    outcome::result<SlotNumber> slotForTimestamp(
        TimePoint timestamp) const override;

    TimePoint slotStartTime(SlotNumber slot) const override;

    outcome::result<primitives::AuthorityBlock> createBlock(
        std::string_view authority_id,
        primitives::Payload payload,
        std::optional<TimePoint> timestamp,
        std::optional<primitives::Payload> metadata) const override;

    outcome::result<void> verifyBlock(
        const primitives::AuthorityBlock &block) const override;

    outcome::result<void> verifyBlock(
        const primitives::AuthorityBlock &block,
        const primitives::AuthorityBlock &previous) const override;

    outcome::result<primitives::AuthorityBlock> submitBlock(
        primitives::AuthorityBlock block) override;

    outcome::result<void> validateChain() const override;

    std::vector<primitives::AuthorityBlock> chain() const override;

    primitives::AuthorityBlock lastBlock() const override;

    primitives::AuthorityBlock genesisBlock() const override;

    size_t height() const override;

    TimePoint genesisTime() const override;

    Duration slotDuration() const override;

    EngineSnapshot snapshot() const override;

   private:
    struct State {
      authority::AuthorityRegistry registry;
      std::vector<primitives::AuthorityBlock> chain;

      const primitives::AuthorityBlock &head() const {
        BOOST_ASSERT(not chain.empty());
        return chain.back();
      }

      /// Slot from which registry changes take effect
      SlotNumber nextSlot() const {
        return head().slot + 1;
      }
    };

    ProofOfAuthorityImpl(std::shared_ptr<const SlotsUtil> slots_util,
                         std::shared_ptr<const clock::SystemClock> clock,
                         primitives::AuthorityBlock genesis);

    outcome::result<void> verify(const State &state,
                                 const primitives::AuthorityBlock &block,
                                 const primitives::AuthorityBlock *previous)
        const;

    TimePoint now() const;

    std::shared_ptr<const SlotsUtil> slots_util_;
    std::shared_ptr<const clock::SystemClock> clock_;
    PoaBlockValidator validator_;
    SafeObject<State> state_;
    log::Logger log_;
  };

}  // namespace dynpoa::consensus::poa
