/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace dynpoa::consensus::poa {

  enum class PoaError {
    INVALID_SLOT = 1,
    NO_ACTIVE_AUTHORITIES,
    INACTIVE_AUTHORITY,
    GENESIS_SLOT_RESERVED,
    SLOT_NOT_ADVANCING,
    NOT_SCHEDULED_LEADER,
    BLOCK_REJECTED,
    WEIGHT_OVERFLOW,
  };

}  // namespace dynpoa::consensus::poa

OUTCOME_HPP_DECLARE_ERROR(dynpoa::consensus::poa, PoaError)
