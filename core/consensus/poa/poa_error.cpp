/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/poa/poa_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(dynpoa::consensus::poa, PoaError, e) {
  using E = dynpoa::consensus::poa::PoaError;
  switch (e) {
    case E::INVALID_SLOT:
      return "slot is reserved for genesis or precedes every authority "
             "snapshot";
    case E::NO_ACTIVE_AUTHORITIES:
      return "no active authorities in the snapshot effective at slot";
    case E::INACTIVE_AUTHORITY:
      return "authority is inactive";
    case E::GENESIS_SLOT_RESERVED:
      return "timestamp corresponds to the genesis slot";
    case E::SLOT_NOT_ADVANCING:
      return "slot must be greater than the slot of the last block";
    case E::NOT_SCHEDULED_LEADER:
      return "authority is not the scheduled leader of the slot";
    case E::BLOCK_REJECTED:
      return "block failed verification";
    case E::WEIGHT_OVERFLOW:
      return "total weight of active authorities does not fit 64 bits";
  }
  return "unknown error (invalid PoaError)";
}
