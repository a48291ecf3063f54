/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/timeline/impl/slots_util_impl.hpp"

#include <limits>

#include <boost/assert.hpp>

#include "consensus/timeline/timeline_error.hpp"

namespace dynpoa::consensus {

  outcome::result<std::shared_ptr<SlotsUtilImpl>> SlotsUtilImpl::create(
      TimePoint genesis_time,
      Duration slot_duration,
      std::shared_ptr<const clock::SystemClock> clock) {
    if (slot_duration <= Duration::zero()) {
      return TimelineError::INVALID_SLOT_DURATION;
    }
    // done so because of private constructor
    return std::shared_ptr<SlotsUtilImpl>(
        new SlotsUtilImpl(genesis_time, slot_duration, std::move(clock)));
  }

  SlotsUtilImpl::SlotsUtilImpl(TimePoint genesis_time,
                               Duration slot_duration,
                               std::shared_ptr<const clock::SystemClock> clock)
      : genesis_time_{genesis_time},
        slot_duration_{slot_duration},
        clock_{std::move(clock)} {
    BOOST_ASSERT(clock_);
  }

  Duration SlotsUtilImpl::slotDuration() const {
    return slot_duration_;
  }

  TimePoint SlotsUtilImpl::genesisTime() const {
    return genesis_time_;
  }

  outcome::result<SlotNumber> SlotsUtilImpl::timeToSlot(TimePoint time) const {
    if (time < genesis_time_) {
      return TimelineError::TIMESTAMP_BEFORE_GENESIS;
    }
    return static_cast<SlotNumber>((time - genesis_time_) / slot_duration_);
  }

  TimePoint SlotsUtilImpl::slotStartTime(SlotNumber slot) const {
    // unsigned distance, genesis may precede the epoch
    const auto room =
        static_cast<uint64_t>(TimePoint::max().time_since_epoch().count())
        - static_cast<uint64_t>(genesis_time_.time_since_epoch().count());
    const auto slot_length = static_cast<uint64_t>(slot_duration_.count());
    if (slot > room / slot_length) {
      return TimePoint::max();
    }
    return genesis_time_
         + Duration{static_cast<Duration::rep>(slot * slot_length)};
  }

  TimePoint SlotsUtilImpl::slotFinishTime(SlotNumber slot) const {
    if (slot == std::numeric_limits<SlotNumber>::max()) {
      return TimePoint::max();
    }
    return slotStartTime(slot + 1);
  }

  outcome::result<SlotNumber> SlotsUtilImpl::currentSlot() const {
    return timeToSlot(
        std::chrono::time_point_cast<Duration>(clock_->now()));
  }

}  // namespace dynpoa::consensus
