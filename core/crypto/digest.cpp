/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/digest.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <boost/assert.hpp>

namespace dynpoa::crypto {

  Sha256Hash sha256(std::string_view input) {
    Sha256Hash out;
    unsigned int out_size = 0;
    [[maybe_unused]] auto ok = EVP_Digest(input.data(),
                                          input.size(),
                                          out.data(),
                                          &out_size,
                                          EVP_sha256(),
                                          nullptr);
    BOOST_ASSERT(ok == 1 and out_size == Sha256Hash::size());
    return out;
  }

  Hmac256 hmacSha256(std::string_view key, std::string_view message) {
    Hmac256 out;
    unsigned int out_size = 0;
    [[maybe_unused]] auto *res =
        HMAC(EVP_sha256(),
             key.data(),
             static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char *>(message.data()),
             message.size(),
             out.data(),
             &out_size);
    BOOST_ASSERT(res != nullptr and out_size == Hmac256::size());
    return out;
  }

  bool tagsEqual(const Hmac256 &lhs, const Hmac256 &rhs) {
    return CRYPTO_memcmp(lhs.data(), rhs.data(), Hmac256::size()) == 0;
  }

}  // namespace dynpoa::crypto
