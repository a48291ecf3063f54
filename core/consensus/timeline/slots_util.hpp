/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "consensus/timeline/types.hpp"
#include "outcome/outcome.hpp"

namespace dynpoa::consensus {

  /**
   * Slot clock. Maps wall-clock time to slot numbers and back, counting
   * fixed-length slots from the genesis time.
   */
  class SlotsUtil {
   public:
    SlotsUtil() = default;
    SlotsUtil(SlotsUtil &&) = delete;
    SlotsUtil(const SlotsUtil &) = delete;

    virtual ~SlotsUtil() = default;

    SlotsUtil &operator=(SlotsUtil &&) = delete;
    SlotsUtil &operator=(const SlotsUtil &) = delete;

    /// @return the duration of a slot
    virtual Duration slotDuration() const = 0;

    /// @return start of slot 0
    virtual TimePoint genesisTime() const = 0;

    /// @returns slot for time, error if time precedes genesis
    virtual outcome::result<SlotNumber> timeToSlot(TimePoint time) const = 0;

    /// @returns timepoint of start of slot #{@param slot}, saturated to
    /// TimePoint::max() when it can not be represented
    virtual TimePoint slotStartTime(SlotNumber slot) const = 0;

    /// @returns timepoint of finish of slot #{@param slot}
    virtual TimePoint slotFinishTime(SlotNumber slot) const = 0;

    /// @returns slot of the current wall-clock time
    virtual outcome::result<SlotNumber> currentSlot() const = 0;
  };

}  // namespace dynpoa::consensus
