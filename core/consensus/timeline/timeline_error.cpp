/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/timeline/timeline_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(dynpoa::consensus, TimelineError, e) {
  using E = dynpoa::consensus::TimelineError;
  switch (e) {
    case E::INVALID_SLOT_DURATION:
      return "slot duration must be positive";
    case E::TIMESTAMP_BEFORE_GENESIS:
      return "timestamp precedes genesis time";
  }
  return "unknown error (dynpoa::consensus::TimelineError)";
}
