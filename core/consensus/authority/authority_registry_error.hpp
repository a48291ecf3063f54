/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "outcome/outcome.hpp"

namespace dynpoa::authority {
  enum class AuthorityRegistryError {
    EMPTY_IDENTIFIER = 1,
    EMPTY_SECRET,
    INVALID_WEIGHT,
    DUPLICATE_AUTHORITY,
    UNKNOWN_AUTHORITY,
    NO_SNAPSHOT_FOR_SLOT,
    NOT_IN_SNAPSHOT,
  };
}

OUTCOME_HPP_DECLARE_ERROR(dynpoa::authority, AuthorityRegistryError)
