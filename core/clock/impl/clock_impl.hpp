/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

namespace dynpoa::clock {

  class SystemClockImpl final : public SystemClock {
   public:
    TimePoint now() const override;
  };

}  // namespace dynpoa::clock
