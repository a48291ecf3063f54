/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cmath>
#include <optional>
#include <string_view>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "primitives/authority.hpp"
#include "primitives/block.hpp"
#include "primitives/payload.hpp"

/**
 * Helpers writing dynpoa primitives through a rapidjson SAX writer. Keys of
 * payloads and of signable block fields are emitted in ascending order, so
 * the output of the compact writer is the canonical form used for hashing.
 */
namespace dynpoa::primitives::json {

  using StringWriter = rapidjson::Writer<rapidjson::StringBuffer>;

  template <typename Writer>
  void key(Writer &writer, std::string_view name) {
    writer.Key(name.data(), static_cast<rapidjson::SizeType>(name.size()));
  }

  template <typename Writer>
  void string(Writer &writer, std::string_view value) {
    writer.String(
        value.data(), static_cast<rapidjson::SizeType>(value.size()), true);
  }

  template <typename Writer>
  void writePayload(Writer &writer, const Payload &payload);

  template <typename Writer>
  void writeValue(Writer &writer, const PayloadValue &value) {
    boost::apply_visitor(
        [&](const auto &v) {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::string>) {
            string(writer, v);
          } else if constexpr (std::is_same_v<T, int64_t>) {
            writer.Int64(v);
          } else if constexpr (std::is_same_v<T, double>) {
            // rapidjson refuses NaN and infinities
            if (std::isfinite(v)) {
              writer.Double(v);
            } else {
              writer.Null();
            }
          } else if constexpr (std::is_same_v<T, bool>) {
            writer.Bool(v);
          } else {
            writePayload(writer, v);
          }
        },
        value.value());
  }

  template <typename Writer>
  void writePayload(Writer &writer, const Payload &payload) {
    writer.StartObject();
    for (const auto &[name, value] : payload) {
      key(writer, name);
      writeValue(writer, value);
    }
    writer.EndObject();
  }

  template <typename Writer>
  void writePayload(Writer &writer, const std::optional<Payload> &payload) {
    if (payload.has_value()) {
      writePayload(writer, payload.value());
    } else {
      writer.Null();
    }
  }

  /// Public part of authority, secret is never exported
  template <typename Writer>
  void writeAuthority(Writer &writer, const Authority &authority) {
    writer.StartObject();
    key(writer, "active");
    writer.Bool(authority.active);
    key(writer, "identifier");
    string(writer, authority.id);
    key(writer, "metadata");
    writePayload(writer, authority.metadata);
    key(writer, "weight");
    writer.Uint64(authority.weight);
    writer.EndObject();
  }

  template <typename Writer>
  void writeSignableFields(Writer &writer, const AuthorityBlock &block) {
    key(writer, "metadata");
    writePayload(writer, block.metadata);
    key(writer, "parent_hash");
    string(writer, block.parent_hash.toHex());
    key(writer, "payload");
    writePayload(writer, block.payload);
    key(writer, "proposer");
    string(writer, block.proposer);
    key(writer, "slot");
    writer.Uint64(block.slot);
    key(writer, "timestamp");
    string(writer, toIsoString(block.timestamp));
  }

  /// Outbound block record, hash is the one carried by the block
  template <typename Writer>
  void writeBlock(Writer &writer, const AuthorityBlock &block) {
    writer.StartObject();
    key(writer, "hash");
    string(writer, block.hash_opt.value_or(computeBlockHash(block)).toHex());
    writeSignableFields(writer, block);
    key(writer, "signature");
    if (block.signature.has_value()) {
      string(writer, block.signature->toHex());
    } else {
      writer.Null();
    }
    writer.EndObject();
  }

}  // namespace dynpoa::primitives::json
