/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/block.hpp"

#include "crypto/digest.hpp"
#include "primitives/json_writer.hpp"

namespace dynpoa::primitives {

  std::string signableContent(const AuthorityBlock &block) {
    rapidjson::StringBuffer buffer;
    json::StringWriter writer(buffer);
    writer.StartObject();
    json::writeSignableFields(writer, block);
    writer.EndObject();
    return {buffer.GetString(), buffer.GetSize()};
  }

  BlockHash computeBlockHash(const AuthorityBlock &block) {
    return crypto::sha256(signableContent(block));
  }

  void calculateBlockHash(AuthorityBlock &block) {
    block.hash_opt = computeBlockHash(block);
  }

  std::string signingMessage(const AuthorityBlock &block) {
    return block.hash().toHex();
  }

  AuthorityBlock makeGenesisBlock(Timestamp timestamp,
                                  Payload payload,
                                  std::optional<Payload> metadata) {
    AuthorityBlock genesis{
        .slot = 0,
        .proposer = kGenesisProposer,
        .timestamp = timestamp,
        .payload = std::move(payload),
        .parent_hash = BlockHash{},
        .metadata = std::move(metadata),
        .signature = std::nullopt,
        .hash_opt = std::nullopt,
    };
    calculateBlockHash(genesis);
    return genesis;
  }

  std::string blockToJson(const AuthorityBlock &block) {
    rapidjson::StringBuffer buffer;
    json::StringWriter writer(buffer);
    json::writeBlock(writer, block);
    return {buffer.GetString(), buffer.GetSize()};
  }

}  // namespace dynpoa::primitives
