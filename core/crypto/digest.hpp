/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include "common/blob.hpp"

namespace dynpoa::crypto {

  /// SHA-256 digest, content hash of blocks
  using Sha256Hash = common::Hash256;

  /// HMAC-SHA-256 tag, signature of blocks
  using Hmac256 = common::Hash256;

  Sha256Hash sha256(std::string_view input);

  /**
   * Keyed message authentication code (RFC 2104) over SHA-256
   * @param key shared secret of the signer
   * @param message authenticated data
   */
  Hmac256 hmacSha256(std::string_view key, std::string_view message);

  /// Compares tags in time independent of their content
  bool tagsEqual(const Hmac256 &lhs, const Hmac256 &rhs);

}  // namespace dynpoa::crypto
