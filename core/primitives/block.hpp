/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <string>

#include <boost/assert.hpp>

#include "crypto/digest.hpp"
#include "primitives/common.hpp"
#include "primitives/payload.hpp"
#include "primitives/timestamp.hpp"

namespace dynpoa::primitives {

  using BlockSignature = crypto::Hmac256;

  /// Proposer of the genesis block
  inline const AuthorityId kGenesisProposer = "__genesis__";

  /**
   * @struct AuthorityBlock is a block proposed by an authority for a slot
   */
  struct AuthorityBlock {
    SlotNumber slot{};                       ///< 0 only for genesis
    AuthorityId proposer;                    ///< Scheduled leader of the slot
    Timestamp timestamp{};                   ///< Must fall into the slot
    Payload payload;                         ///< Opaque block content
    BlockHash parent_hash{};                 ///< Content hash of the parent
    std::optional<Payload> metadata;         ///< Opaque auxiliary data
    std::optional<BlockSignature> signature; ///< MAC of hash, none in genesis
    std::optional<BlockHash> hash_opt;       ///< Content hash if calculated

    bool operator==(const AuthorityBlock &) const = default;

    const BlockHash &hash() const {
      BOOST_ASSERT_MSG(hash_opt.has_value(),
                       "Hash must be calculated and saved before that");
      return hash_opt.value();
    }

    bool isGenesis() const {
      return slot == 0;
    }
  };

  /**
   * Canonical (sorted keys, compact) JSON of the signable fields:
   * metadata, parent_hash, payload, proposer, slot, timestamp
   */
  std::string signableContent(const AuthorityBlock &block);

  /// SHA-256 of the signable content
  BlockHash computeBlockHash(const AuthorityBlock &block);

  /// Recalculates the content hash and stores it into the block
  void calculateBlockHash(AuthorityBlock &block);

  /// Message authenticated by the proposer, hex of the content hash
  std::string signingMessage(const AuthorityBlock &block);

  /**
   * Creates hashed genesis block at slot 0 with zero parent hash and no
   * signature
   */
  AuthorityBlock makeGenesisBlock(Timestamp timestamp,
                                  Payload payload = {},
                                  std::optional<Payload> metadata = {});

  /**
   * Outbound record of a block: slot, proposer, timestamp, payload,
   * parent_hash, hash, signature and metadata
   */
  std::string blockToJson(const AuthorityBlock &block);

}  // namespace dynpoa::primitives
