/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/chain_spec_impl.hpp"

#include <boost/property_tree/json_parser.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(dynpoa::application, ChainSpecImpl::Error, e) {
  using E = dynpoa::application::ChainSpecImpl::Error;
  switch (e) {
    case E::MISSING_ENTRY:
      return "A required entry is missing in the config file";
    case E::PARSER_ERROR:
      return "Internal parser error";
    case E::INVALID_ENTRY:
      return "An entry of the config file has invalid value";
  }
  return "Unknown error in ChainSpecImpl";
}

namespace dynpoa::application {

  namespace pt = boost::property_tree;

  namespace {
    /**
     * Objects become nested payloads, leaves are kept as strings. Arrays
     * (children with empty keys in ptree) are rejected.
     */
    outcome::result<primitives::Payload> toPayload(const pt::ptree &tree) {
      primitives::Payload payload;
      for (auto &[key, value] : tree) {
        if (key.empty()) {
          return ChainSpecImpl::Error::INVALID_ENTRY;
        }
        if (value.empty()) {
          payload.emplace(key, value.get_value<std::string>());
        } else {
          OUTCOME_TRY(nested, toPayload(value));
          payload.emplace(key, std::move(nested));
        }
      }
      return payload;
    }

    bool isNull(const pt::ptree &tree) {
      return tree.empty() and tree.get_value<std::string>() == "null";
    }
  }  // namespace

  outcome::result<std::shared_ptr<ChainSpecImpl>> ChainSpecImpl::loadFrom(
      const std::string &path) {
    // done so because of private constructor
    std::shared_ptr<ChainSpecImpl> config_storage{new ChainSpecImpl};
    OUTCOME_TRY(config_storage->loadFromJson(path));

    return config_storage;
  }

  outcome::result<void> ChainSpecImpl::loadFromJson(
      const std::string &file_path) {
    config_path_ = file_path;
    pt::ptree tree;
    try {
      pt::read_json(file_path, tree);
    } catch (pt::json_parser_error &e) {
      log_->error(
          "Parser error: {}, line {}: {}", e.filename(), e.line(), e.message());
      return Error::PARSER_ERROR;
    }

    OUTCOME_TRY(loadFields(tree));
    OUTCOME_TRY(loadGenesis(tree));
    OUTCOME_TRY(loadAuthorities(tree));

    return outcome::success();
  }

  outcome::result<void> ChainSpecImpl::loadFields(
      const boost::property_tree::ptree &tree) {
    OUTCOME_TRY(name, ensure("name", tree.get_child_optional("name")));
    name_ = name.get<std::string>("");

    OUTCOME_TRY(id, ensure("id", tree.get_child_optional("id")));
    id_ = id.get<std::string>("");

    OUTCOME_TRY(slot_duration,
                ensure("slotDuration",
                       tree.get_optional<int64_t>("slotDuration")));
    if (slot_duration <= 0) {
      log_->error("'slotDuration' must be positive, got {}", slot_duration);
      return Error::INVALID_ENTRY;
    }
    slot_duration_ = std::chrono::milliseconds{slot_duration};

    if (auto entry = tree.get_child_optional("genesisTime");
        entry.has_value() and not isNull(entry.value())) {
      auto millis = entry.value().get_value_optional<int64_t>();
      if (not millis.has_value() or millis.value() < 0) {
        log_->error("'genesisTime' must be unix time in milliseconds");
        return Error::INVALID_ENTRY;
      }
      genesis_time_ =
          primitives::fromUnixMillis(static_cast<uint64_t>(millis.value()));
    } else {
      log_->warn(
          "Field 'genesisTime' was not specified in the chain spec. "
          "Start time of the node is used.");
    }

    return outcome::success();
  }

  outcome::result<void> ChainSpecImpl::loadGenesis(
      const boost::property_tree::ptree &tree) {
    auto genesis_opt = tree.get_child_optional("genesis");
    if (not genesis_opt.has_value()) {
      return outcome::success();
    }
    if (auto payload = genesis_opt->get_child_optional("payload");
        payload.has_value() and not isNull(payload.value())) {
      auto res = toPayload(payload.value());
      if (res.has_error()) {
        log_->error("'genesis.payload' must be an object without arrays");
        return res.as_failure();
      }
      genesis_payload_ = std::move(res.value());
    }
    if (auto metadata = genesis_opt->get_child_optional("metadata");
        metadata.has_value() and not isNull(metadata.value())) {
      auto res = toPayload(metadata.value());
      if (res.has_error()) {
        log_->error("'genesis.metadata' must be an object without arrays");
        return res.as_failure();
      }
      genesis_metadata_ = std::move(res.value());
    }
    return outcome::success();
  }

  outcome::result<void> ChainSpecImpl::loadAuthorities(
      const boost::property_tree::ptree &tree) {
    OUTCOME_TRY(authorities,
                ensure("authorities", tree.get_child_optional("authorities")));

    for (auto &[_, entry] : authorities) {
      OUTCOME_TRY(
          id, ensure("authorities[].id", entry.get_optional<std::string>("id")));
      OUTCOME_TRY(secret,
                  ensure("authorities[].secret",
                         entry.get_optional<std::string>("secret")));

      primitives::Authority authority{.id = id, .secret = secret};

      if (auto weight_opt = entry.get_child_optional("weight");
          weight_opt.has_value()) {
        auto weight = weight_opt->get_value_optional<int64_t>();
        if (not weight.has_value() or weight.value() < 1) {
          log_->error("Weight of authority '{}' must be a positive integer",
                      authority.id);
          return Error::INVALID_ENTRY;
        }
        authority.weight = static_cast<primitives::AuthorityWeight>(*weight);
      }

      if (auto active_opt = entry.get_child_optional("active");
          active_opt.has_value()) {
        auto active = active_opt->get_value_optional<bool>();
        if (not active.has_value()) {
          log_->error("'active' of authority '{}' must be boolean",
                      authority.id);
          return Error::INVALID_ENTRY;
        }
        authority.active = active.value();
      }

      if (auto metadata = entry.get_child_optional("metadata");
          metadata.has_value() and not isNull(metadata.value())) {
        auto res = toPayload(metadata.value());
        if (res.has_error()) {
          log_->error("Metadata of authority '{}' must be an object without "
                      "arrays",
                      authority.id);
          return res.as_failure();
        }
        authority.metadata = std::move(res.value());
      }

      authorities_.emplace_back(std::move(authority));
    }

    return outcome::success();
  }

}  // namespace dynpoa::application
