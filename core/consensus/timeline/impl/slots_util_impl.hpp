/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/timeline/slots_util.hpp"

#include <memory>

#include "clock/clock.hpp"

namespace dynpoa::consensus {

  class SlotsUtilImpl final : public SlotsUtil {
   public:
    /// Fails with INVALID_SLOT_DURATION unless {@param slot_duration} > 0
    static outcome::result<std::shared_ptr<SlotsUtilImpl>> create(
        TimePoint genesis_time,
        Duration slot_duration,
        std::shared_ptr<const clock::SystemClock> clock);

    Duration slotDuration() const override;

    TimePoint genesisTime() const override;

    outcome::result<SlotNumber> timeToSlot(TimePoint time) const override;

    TimePoint slotStartTime(SlotNumber slot) const override;

    TimePoint slotFinishTime(SlotNumber slot) const override;

    outcome::result<SlotNumber> currentSlot() const override;

   private:
    SlotsUtilImpl(TimePoint genesis_time,
                  Duration slot_duration,
                  std::shared_ptr<const clock::SystemClock> clock);

    const TimePoint genesis_time_;
    const Duration slot_duration_;
    std::shared_ptr<const clock::SystemClock> clock_;
  };

}  // namespace dynpoa::consensus
