/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/poa/engine_snapshot.hpp"

#include <rapidjson/prettywriter.h>

#include "primitives/json_writer.hpp"

namespace dynpoa::consensus::poa {

  namespace {
    template <typename Writer>
    void writeAuthorities(Writer &writer,
                          const primitives::AuthorityList &authorities) {
      writer.StartArray();
      for (const auto &authority : authorities) {
        primitives::json::writeAuthority(writer, authority);
      }
      writer.EndArray();
    }

    template <typename Writer>
    void writeSnapshot(Writer &writer, const EngineSnapshot &snapshot) {
      namespace json = primitives::json;
      using Seconds = std::chrono::duration<double>;

      writer.StartObject();

      json::key(writer, "authorities");
      writeAuthorities(writer, snapshot.authorities);

      json::key(writer, "authority_history");
      writer.StartArray();
      for (const auto &entry : snapshot.authority_history) {
        writer.StartObject();
        json::key(writer, "authorities");
        writeAuthorities(writer, *entry.authorities);
        json::key(writer, "start_slot");
        writer.Uint64(entry.start_slot);
        writer.EndObject();
      }
      writer.EndArray();

      json::key(writer, "chain");
      writer.StartArray();
      for (const auto &block : snapshot.chain) {
        json::writeBlock(writer, block);
      }
      writer.EndArray();

      json::key(writer, "genesis_time");
      json::string(writer, primitives::toIsoString(snapshot.genesis_time));

      json::key(writer, "slot_duration_seconds");
      writer.Double(
          std::chrono::duration_cast<Seconds>(snapshot.slot_duration).count());

      writer.EndObject();
    }
  }  // namespace

  std::string snapshotToJson(const EngineSnapshot &snapshot, bool pretty) {
    rapidjson::StringBuffer buffer;
    if (pretty) {
      rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
      writeSnapshot(writer, snapshot);
    } else {
      primitives::json::StringWriter writer(buffer);
      writeSnapshot(writer, snapshot);
    }
    return {buffer.GetString(), buffer.GetSize()};
  }

}  // namespace dynpoa::consensus::poa
