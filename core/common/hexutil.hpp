/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <span>
#include <string>

namespace dynpoa::common {

  /// Lowercase hex of {@param bytes}, two chars per byte, no prefix
  std::string hexLower(std::span<const uint8_t> bytes);

}  // namespace dynpoa::common
