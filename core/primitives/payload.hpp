/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <concepts>
#include <cstdint>
#include <functional>
#include <map>
#include <string>

#include <boost/variant.hpp>

namespace dynpoa::primitives {

  struct Payload;

  /**
   * Value of an opaque payload entry: string, integer, floating point, bool
   * or nested map. Never interpreted by consensus, only hashed.
   */
  class PayloadValue {
   public:
    using Variant = boost::variant<std::string,
                                   int64_t,
                                   double,
                                   bool,
                                   boost::recursive_wrapper<Payload>>;

    PayloadValue() = default;

    PayloadValue(std::string value) : value_{std::move(value)} {}

    PayloadValue(const char *value) : value_{std::string{value}} {}

    template <std::integral T>
      requires(not std::same_as<T, bool>)
    PayloadValue(T value) : value_{static_cast<int64_t>(value)} {}

    PayloadValue(double value) : value_{value} {}

    PayloadValue(bool value) : value_{value} {}

    PayloadValue(Payload value);

    const Variant &value() const {
      return value_;
    }

    bool operator==(const PayloadValue &other) const {
      return value_ == other.value_;
    }

   private:
    Variant value_;
  };

  /**
   * Order-insensitive string-keyed map. Keys are kept sorted, which makes
   * its serialization canonical.
   */
  struct Payload : std::map<std::string, PayloadValue, std::less<>> {
    using map::map;
  };

  inline PayloadValue::PayloadValue(Payload value) : value_{std::move(value)} {}

}  // namespace dynpoa::primitives
