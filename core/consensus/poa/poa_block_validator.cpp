/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/poa/poa_block_validator.hpp"

#include "consensus/poa/leader_schedule.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(dynpoa::consensus::poa,
                            PoaBlockValidator::ValidationError,
                            e) {
  using E = dynpoa::consensus::poa::PoaBlockValidator::ValidationError;
  switch (e) {
    case E::GENESIS_MISMATCH:
      return "genesis block differs from the genesis of the chain";
    case E::HASH_MISMATCH:
      return "content hash of the block does not match its fields";
    case E::SLOT_NOT_ADVANCING:
      return "slot of the block does not exceed the slot of its parent";
    case E::PARENT_HASH_MISMATCH:
      return "parent hash of the block differs from the hash of its parent";
    case E::NO_AUTHORITIES:
      return "no authority is scheduled for the slot of the block";
    case E::UNEXPECTED_PROPOSER:
      return "proposer is not the scheduled leader of the slot";
    case E::INACTIVE_PROPOSER:
      return "proposer was not active at the slot of the block";
    case E::SLOT_TIMESTAMP_MISMATCH:
      return "timestamp of the block is outside of its slot";
    case E::MISSING_SIGNATURE:
      return "block is not signed";
    case E::INVALID_SIGNATURE:
      return "signature of the block is invalid";
  }
  return "unknown error";
}

namespace dynpoa::consensus::poa {

  PoaBlockValidator::PoaBlockValidator(
      std::shared_ptr<const SlotsUtil> slots_util)
      : slots_util_(std::move(slots_util)),
        log_(log::createLogger("PoaBlockValidator", "block_validator")) {
    BOOST_ASSERT(slots_util_);
  }

  outcome::result<void> PoaBlockValidator::validateGenesis(
      const primitives::AuthorityBlock &block,
      const primitives::AuthorityBlock &genesis,
      bool has_parent) const {
    if (has_parent or block != genesis) {
      SL_DEBUG(log_, "Block of slot 0 is not the genesis of the chain");
      return ValidationError::GENESIS_MISMATCH;
    }
    return outcome::success();
  }

  outcome::result<void> PoaBlockValidator::validate(
      const primitives::AuthorityBlock &block,
      const primitives::AuthorityBlock &parent,
      const authority::AuthorityHistory &history) const {
    BOOST_ASSERT(not block.isGenesis());

    // any change of signable fields must be detected
    if (not block.hash_opt.has_value()
        or block.hash_opt.value() != primitives::computeBlockHash(block)) {
      SL_DEBUG(log_, "Block of slot {} has wrong content hash", block.slot);
      return ValidationError::HASH_MISMATCH;
    }

    if (block.slot <= parent.slot) {
      SL_DEBUG(log_,
               "Block {:l} has slot {}, parent slot is {}",
               block.hash(),
               block.slot,
               parent.slot);
      return ValidationError::SLOT_NOT_ADVANCING;
    }
    if (block.parent_hash != parent.hash()) {
      SL_DEBUG(log_,
               "Block {:l} refers parent {:l} instead of {:l}",
               block.hash(),
               block.parent_hash,
               parent.hash());
      return ValidationError::PARENT_HASH_MISMATCH;
    }

    auto expected_res = authorityForSlot(block.slot, history);
    if (expected_res.has_error()) {
      SL_DEBUG(log_,
               "No leader for slot {}: {}",
               block.slot,
               expected_res.error().message());
      return ValidationError::NO_AUTHORITIES;
    }
    const auto &expected = expected_res.value();
    if (block.proposer != expected.id) {
      SL_DEBUG(log_,
               "Block {:l} proposed by {}, but leader of slot {} is {}",
               block.hash(),
               block.proposer,
               block.slot,
               expected.id);
      return ValidationError::UNEXPECTED_PROPOSER;
    }

    auto proposer_res = history.authorityAt(block.slot, block.proposer);
    if (proposer_res.has_error() or not proposer_res.value().active) {
      SL_DEBUG(log_,
               "Proposer {} was not active at slot {}",
               block.proposer,
               block.slot);
      return ValidationError::INACTIVE_PROPOSER;
    }
    const auto &proposer = proposer_res.value();

    auto slot_res = slots_util_->timeToSlot(block.timestamp);
    if (slot_res.has_error() or slot_res.value() != block.slot) {
      SL_DEBUG(log_,
               "Timestamp {} of block {:l} is outside of slot {}",
               primitives::toIsoString(block.timestamp),
               block.hash(),
               block.slot);
      return ValidationError::SLOT_TIMESTAMP_MISMATCH;
    }

    if (not block.signature.has_value()) {
      return ValidationError::MISSING_SIGNATURE;
    }
    if (not verifySignature(block, proposer)) {
      SL_DEBUG(log_,
               "Block {:l} has invalid signature of {}",
               block.hash(),
               proposer.id);
      return ValidationError::INVALID_SIGNATURE;
    }

    return outcome::success();
  }

  bool PoaBlockValidator::verifySignature(
      const primitives::AuthorityBlock &block,
      const primitives::Authority &proposer) const {
    BOOST_ASSERT(block.signature.has_value());
    auto expected = proposer.sign(primitives::signingMessage(block));
    return crypto::tagsEqual(expected, block.signature.value());
  }

}  // namespace dynpoa::consensus::poa
