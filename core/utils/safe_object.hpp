/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <mutex>
#include <shared_mutex>
#include <utility>

namespace dynpoa {

  /**
   * Value guarded by a reader-writer lock. The value is reachable only from
   * a callback which runs under the lock:
   * @code
   *  SafeObject<State> state;
   *  state.exclusiveAccess([&](State &s) { s.chain.push_back(block); });
   *  auto height = state.sharedAccess([](const State &s) {
   *    return s.chain.size();
   *  });
   * @endcode
   */
  template <typename T>
  class SafeObject {
   public:
    template <typename... Args>
    explicit SafeObject(Args &&...args) : value_(std::forward<Args>(args)...) {}

    SafeObject(const SafeObject &) = delete;
    SafeObject &operator=(const SafeObject &) = delete;

    /// Runs {@param f} with a mutable reference, no other access meanwhile
    template <typename F>
    auto exclusiveAccess(F &&f) {
      std::unique_lock lock(mutex_);
      return std::invoke(std::forward<F>(f), value_);
    }

    /// Runs {@param f} with a const reference, concurrently with other readers
    template <typename F>
    auto sharedAccess(F &&f) const {
      std::shared_lock lock(mutex_);
      return std::invoke(std::forward<F>(f), std::as_const(value_));
    }

   private:
    T value_;
    mutable std::shared_mutex mutex_;
  };

}  // namespace dynpoa
