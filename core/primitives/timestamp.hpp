/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

namespace dynpoa::primitives {

  /// UTC instant with microsecond precision
  using Timestamp = std::chrono::time_point<std::chrono::system_clock,
                                            std::chrono::microseconds>;

  /**
   * ISO-8601 representation in UTC with `Z` suffix, e.g.
   * 2024-01-01T00:00:05Z or 2024-01-01T00:00:05.250000Z. Fraction is printed
   * only when it is not zero.
   */
  std::string toIsoString(Timestamp timestamp);

  Timestamp fromUnixMillis(uint64_t millis);

}  // namespace dynpoa::primitives
