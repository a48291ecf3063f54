/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <ostream>

#include <fmt/format.h>

#include "common/hexutil.hpp"

namespace dynpoa::common {

  /**
   * Fixed-size byte string. Digests and MACs are blobs, their textual form
   * is lowercase hex.
   */
  template <size_t N>
  class Blob : public std::array<uint8_t, N> {
   public:
    constexpr Blob() : std::array<uint8_t, N>{} {}

    static constexpr size_t size() {
      return N;
    }

    std::string toHex() const {
      return hexLower(*this);
    }
  };

  using Hash256 = Blob<32>;

  extern template class Blob<32>;

  template <size_t N>
  std::ostream &operator<<(std::ostream &os, const Blob<N> &blob) {
    return os << blob.toHex();
  }

}  // namespace dynpoa::common

/// `{}` prints first and last 4 hex chars, `{:l}` prints the whole hex
template <size_t N>
struct fmt::formatter<dynpoa::common::Blob<N>> {
  bool full = false;

  constexpr auto parse(format_parse_context &ctx) -> decltype(ctx.begin()) {
    auto it = ctx.begin();
    if (it != ctx.end() and (*it == 'l' or *it == 's')) {
      full = *it++ == 'l';
    }
    if (it != ctx.end() and *it != '}') {
      throw format_error("invalid blob format");
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const dynpoa::common::Blob<N> &blob, FormatContext &ctx) const
      -> decltype(ctx.out()) {
    auto hex = blob.toHex();
    if (full or hex.size() <= 8) {
      return fmt::format_to(ctx.out(), "{}", hex);
    }
    return fmt::format_to(
        ctx.out(), "{}…{}", hex.substr(0, 4), hex.substr(hex.size() - 4));
  }
};
