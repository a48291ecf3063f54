/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/timestamp.hpp"

#include <ctime>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace dynpoa::primitives {

  std::string toIsoString(Timestamp timestamp) {
    auto seconds = std::chrono::floor<std::chrono::seconds>(timestamp);
    auto micros = (timestamp - seconds).count();
    auto time = static_cast<std::time_t>(seconds.time_since_epoch().count());

    auto result = fmt::format("{:%Y-%m-%dT%H:%M:%S}", fmt::gmtime(time));
    if (micros != 0) {
      result += fmt::format(".{:06d}", micros);
    }
    result += 'Z';
    return result;
  }

  Timestamp fromUnixMillis(uint64_t millis) {
    return Timestamp{std::chrono::milliseconds{millis}};
  }

}  // namespace dynpoa::primitives
