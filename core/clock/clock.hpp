/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>

namespace dynpoa::clock {

  /**
   * Wall clock. Source of the genesis time and of default block timestamps,
   * replaced by a mock in tests.
   */
  class SystemClock {
   public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~SystemClock() = default;

    virtual TimePoint now() const = 0;
  };

}  // namespace dynpoa::clock
