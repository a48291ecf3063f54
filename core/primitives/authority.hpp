/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>
#include <vector>

#include "crypto/digest.hpp"
#include "primitives/common.hpp"
#include "primitives/payload.hpp"

namespace dynpoa::primitives {

  /**
   * Authority, which is allowed to propose blocks in the slots it is
   * scheduled for
   */
  struct Authority {
    AuthorityId id;
    std::string secret;          ///< shared key material of the MAC
    AuthorityWeight weight{1};   ///< slots per rotation cycle
    bool active{true};
    Payload metadata;

    bool operator==(const Authority &) const = default;

    /// @return MAC of {@param message} keyed by secret of the authority
    crypto::Hmac256 sign(std::string_view message) const {
      return crypto::hmacSha256(secret, message);
    }
  };

  /**
   * List of authorities, sorted by id
   */
  using AuthorityList = std::vector<Authority>;

}  // namespace dynpoa::primitives
