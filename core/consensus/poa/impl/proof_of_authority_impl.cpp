/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/poa/impl/proof_of_authority_impl.hpp"

#include "consensus/authority/authority_registry_error.hpp"
#include "consensus/poa/leader_schedule.hpp"
#include "consensus/poa/poa_error.hpp"
#include "consensus/timeline/impl/slots_util_impl.hpp"

namespace dynpoa::consensus::poa {

  outcome::result<std::shared_ptr<ProofOfAuthorityImpl>>
  ProofOfAuthorityImpl::create(
      EngineConfig config, std::shared_ptr<const clock::SystemClock> clock) {
    BOOST_ASSERT(clock);
    auto genesis_time = config.genesis_time.has_value()
                          ? config.genesis_time.value()
                          : std::chrono::time_point_cast<Duration>(clock->now());

    OUTCOME_TRY(slots_util,
                SlotsUtilImpl::create(
                    genesis_time, config.slot_duration, clock));

    auto genesis = primitives::makeGenesisBlock(
        genesis_time,
        std::move(config.genesis_payload),
        std::move(config.genesis_metadata));

    // done so because of private constructor
    auto engine =
        std::shared_ptr<ProofOfAuthorityImpl>(new ProofOfAuthorityImpl(
            std::move(slots_util), std::move(clock), std::move(genesis)));

    auto registered = engine->state_.exclusiveAccess(
        [&](State &state) -> outcome::result<void> {
          for (auto &authority : config.authorities) {
            OUTCOME_TRY(state.registry.registerAuthority(
                std::move(authority), true, state.nextSlot()));
          }
          // recorded even without authorities, so that slot 1 has a set
          state.registry.recordSnapshot(state.nextSlot());
          return outcome::success();
        });
    OUTCOME_TRY(registered);

    auto genesis_hash = engine->genesisBlock().hash();
    SL_INFO(engine->log_,
            "Genesis {:l} at {}, slot duration {}us, {} authorities",
            genesis_hash,
            primitives::toIsoString(genesis_time),
            config.slot_duration.count(),
            engine->authorities().size());
    return engine;
  }

  ProofOfAuthorityImpl::ProofOfAuthorityImpl(
      std::shared_ptr<const SlotsUtil> slots_util,
      std::shared_ptr<const clock::SystemClock> clock,
      primitives::AuthorityBlock genesis)
      : slots_util_(std::move(slots_util)),
        clock_(std::move(clock)),
        validator_(slots_util_),
        state_(State{.registry = {}, .chain = {std::move(genesis)}}),
        log_(log::createLogger("ProofOfAuthority", "poa")) {
    BOOST_ASSERT(slots_util_);
    BOOST_ASSERT(clock_);
  }

  outcome::result<primitives::Authority>
  ProofOfAuthorityImpl::registerAuthority(primitives::Authority authority,
                                          bool overwrite) {
    return state_.exclusiveAccess([&](State &state) {
      return state.registry.registerAuthority(
          std::move(authority), overwrite, state.nextSlot());
    });
  }

  outcome::result<primitives::Authority>
  ProofOfAuthorityImpl::deregisterAuthority(std::string_view id) {
    return state_.exclusiveAccess([&](State &state) {
      return state.registry.deregisterAuthority(id, state.nextSlot());
    });
  }

  outcome::result<primitives::Authority> ProofOfAuthorityImpl::updateAuthority(
      std::string_view id, const authority::AuthorityUpdate &update) {
    return state_.exclusiveAccess([&](State &state) {
      return state.registry.updateAuthority(id, update, state.nextSlot());
    });
  }

  primitives::AuthorityList ProofOfAuthorityImpl::activeAuthorities() const {
    return state_.sharedAccess(
        [](const State &state) { return state.registry.activeAuthorities(); });
  }

  primitives::AuthorityList ProofOfAuthorityImpl::authorities() const {
    return state_.sharedAccess(
        [](const State &state) { return state.registry.authorities(); });
  }

  outcome::result<primitives::Authority>
  ProofOfAuthorityImpl::authorityForSlot(SlotNumber slot) const {
    return state_.sharedAccess([&](const State &state) {
      return poa::authorityForSlot(slot, state.registry.history());
    });
  }

  outcome::result<primitives::Authority>
  ProofOfAuthorityImpl::expectedAuthorityAt(TimePoint timestamp) const {
    OUTCOME_TRY(slot, slotForTimestamp(timestamp));
    if (slot == 0) {
      return PoaError::GENESIS_SLOT_RESERVED;
    }
    return authorityForSlot(slot);
  }

  outcome::result<SlotNumber> ProofOfAuthorityImpl::slotForTimestamp(
      TimePoint timestamp) const {
    return slots_util_->timeToSlot(timestamp);
  }

  TimePoint ProofOfAuthorityImpl::slotStartTime(SlotNumber slot) const {
    return slots_util_->slotStartTime(slot);
  }

  outcome::result<primitives::AuthorityBlock> ProofOfAuthorityImpl::createBlock(
      std::string_view authority_id,
      primitives::Payload payload,
      std::optional<TimePoint> timestamp,
      std::optional<primitives::Payload> metadata) const {
    OUTCOME_TRY(id, authority::normalizeIdentifier(authority_id));
    auto block_time = timestamp.value_or(now());

    return state_.sharedAccess(
        [&](const State &state) -> outcome::result<primitives::AuthorityBlock> {
          auto authority = state.registry.find(id);
          if (not authority.has_value()) {
            return authority::AuthorityRegistryError::UNKNOWN_AUTHORITY;
          }
          if (not authority->active) {
            return PoaError::INACTIVE_AUTHORITY;
          }

          OUTCOME_TRY(slot, slots_util_->timeToSlot(block_time));
          if (slot == 0) {
            return PoaError::GENESIS_SLOT_RESERVED;
          }
          const auto &head = state.head();
          if (slot <= head.slot) {
            return PoaError::SLOT_NOT_ADVANCING;
          }

          OUTCOME_TRY(expected,
                      poa::authorityForSlot(slot, state.registry.history()));
          if (expected.id != id) {
            SL_DEBUG(log_,
                     "{} is not the leader of slot {}, {} is",
                     id,
                     slot,
                     expected.id);
            return PoaError::NOT_SCHEDULED_LEADER;
          }

          primitives::AuthorityBlock block{
              .slot = slot,
              .proposer = id,
              .timestamp = block_time,
              .payload = std::move(payload),
              .parent_hash = head.hash(),
              .metadata = std::move(metadata),
              .signature = std::nullopt,
              .hash_opt = std::nullopt,
          };
          primitives::calculateBlockHash(block);
          block.signature =
              authority->sign(primitives::signingMessage(block));

          SL_DEBUG(log_,
                   "Block {:l} created by {} for slot {}",
                   block.hash(),
                   id,
                   slot);
          return block;
        });
  }

  outcome::result<void> ProofOfAuthorityImpl::verify(
      const State &state,
      const primitives::AuthorityBlock &block,
      const primitives::AuthorityBlock *previous) const {
    if (block.isGenesis()) {
      return validator_.validateGenesis(
          block, state.chain.front(), previous != nullptr);
    }
    const auto &parent = previous != nullptr ? *previous : state.head();
    return validator_.validate(block, parent, state.registry.history());
  }

  outcome::result<void> ProofOfAuthorityImpl::verifyBlock(
      const primitives::AuthorityBlock &block) const {
    return state_.sharedAccess(
        [&](const State &state) { return verify(state, block, nullptr); });
  }

  outcome::result<void> ProofOfAuthorityImpl::verifyBlock(
      const primitives::AuthorityBlock &block,
      const primitives::AuthorityBlock &previous) const {
    return state_.sharedAccess(
        [&](const State &state) { return verify(state, block, &previous); });
  }

  outcome::result<primitives::AuthorityBlock> ProofOfAuthorityImpl::submitBlock(
      primitives::AuthorityBlock block) {
    return state_.exclusiveAccess(
        [&](State &state) -> outcome::result<primitives::AuthorityBlock> {
          // explicit parent, so that genesis can not be submitted again
          auto res = verify(state, block, &state.head());
          if (res.has_error()) {
            SL_WARN(log_,
                    "Block of slot {} by {} rejected: {}",
                    block.slot,
                    block.proposer,
                    res.error().message());
            return PoaError::BLOCK_REJECTED;
          }
          state.chain.push_back(block);
          SL_INFO(log_,
                  "Block {:l} of slot {} by {} accepted, height {}",
                  block.hash(),
                  block.slot,
                  block.proposer,
                  state.chain.size());
          return block;
        });
  }

  outcome::result<void> ProofOfAuthorityImpl::validateChain() const {
    return state_.sharedAccess(
        [&](const State &state) -> outcome::result<void> {
          const auto &chain = state.chain;
          if (chain.front().slot != 0) {
            return PoaBlockValidator::ValidationError::GENESIS_MISMATCH;
          }
          for (size_t i = 1; i < chain.size(); ++i) {
            auto res = verify(state, chain[i], &chain[i - 1]);
            if (res.has_error()) {
              SL_WARN(log_,
                      "Chain is invalid at height {}: {}",
                      i,
                      res.error().message());
              return res;
            }
          }
          return outcome::success();
        });
  }

  std::vector<primitives::AuthorityBlock> ProofOfAuthorityImpl::chain() const {
    return state_.sharedAccess([](const State &state) { return state.chain; });
  }

  primitives::AuthorityBlock ProofOfAuthorityImpl::lastBlock() const {
    return state_.sharedAccess(
        [](const State &state) { return state.head(); });
  }

  primitives::AuthorityBlock ProofOfAuthorityImpl::genesisBlock() const {
    return state_.sharedAccess(
        [](const State &state) { return state.chain.front(); });
  }

  size_t ProofOfAuthorityImpl::height() const {
    return state_.sharedAccess(
        [](const State &state) { return state.chain.size(); });
  }

  TimePoint ProofOfAuthorityImpl::genesisTime() const {
    return slots_util_->genesisTime();
  }

  Duration ProofOfAuthorityImpl::slotDuration() const {
    return slots_util_->slotDuration();
  }

  EngineSnapshot ProofOfAuthorityImpl::snapshot() const {
    return state_.sharedAccess([&](const State &state) {
      return EngineSnapshot{
          .genesis_time = slots_util_->genesisTime(),
          .slot_duration = slots_util_->slotDuration(),
          .authorities = state.registry.authorities(),
          .authority_history = state.registry.history().entries(),
          .chain = state.chain,
      };
    });
  }

  TimePoint ProofOfAuthorityImpl::now() const {
    return std::chrono::time_point_cast<Duration>(clock_->now());
  }

}  // namespace dynpoa::consensus::poa
