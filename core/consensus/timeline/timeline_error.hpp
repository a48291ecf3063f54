/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace dynpoa::consensus {

  enum class TimelineError {
    INVALID_SLOT_DURATION = 1,
    TIMESTAMP_BEFORE_GENESIS,
  };

}  // namespace dynpoa::consensus

OUTCOME_HPP_DECLARE_ERROR(dynpoa::consensus, TimelineError)
