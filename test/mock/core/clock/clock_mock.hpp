/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/clock.hpp"

#include <gmock/gmock.h>

namespace dynpoa::clock {

  class SystemClockMock : public SystemClock {
   public:
    MOCK_METHOD(TimePoint, now, (), (const, override));
  };

}  // namespace dynpoa::clock
