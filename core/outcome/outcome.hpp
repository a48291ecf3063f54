/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/outcome/outcome.hpp>

/**
 * Result type used by every fallible dynpoa operation. Errors are
 * std::error_code values of enums registered with
 * OUTCOME_HPP_DECLARE_ERROR/OUTCOME_CPP_DEFINE_CATEGORY.
 */
namespace outcome {
  using libp2p::outcome::failure;
  using libp2p::outcome::result;
  using libp2p::outcome::success;
}  // namespace outcome
