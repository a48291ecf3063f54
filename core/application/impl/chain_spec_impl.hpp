/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/chain_spec.hpp"

#include <memory>

#include <boost/property_tree/ptree.hpp>

#include "log/logger.hpp"
#include "outcome/outcome.hpp"

namespace dynpoa::application {

  /**
   * Chain spec read from JSON file:
   * @code
   * {
   *   "name": "Local Testnet",
   *   "id": "local_testnet",
   *   "genesisTime": 1700000000000,            // unix ms, optional
   *   "slotDuration": 5000,                    // ms
   *   "genesis": {"payload": {}, "metadata": {}},
   *   "authorities": [
   *     {"id": "alice", "secret": "...", "weight": 2, "active": true,
   *      "metadata": {}}
   *   ]
   * }
   * @endcode
   */
  class ChainSpecImpl : public ChainSpec {
   public:
    enum class Error {
      MISSING_ENTRY = 1,
      PARSER_ERROR,
      INVALID_ENTRY,
    };

    static outcome::result<std::shared_ptr<ChainSpecImpl>> loadFrom(
        const std::string &config_path);

    ~ChainSpecImpl() override = default;

    const std::string &name() const override {
      return name_;
    }

    const std::string &id() const override {
      return id_;
    }

    std::optional<consensus::TimePoint> genesisTime() const override {
      return genesis_time_;
    }

    consensus::Duration slotDuration() const override {
      return slot_duration_;
    }

    const primitives::Payload &genesisPayload() const override {
      return genesis_payload_;
    }

    const std::optional<primitives::Payload> &genesisMetadata()
        const override {
      return genesis_metadata_;
    }

    const primitives::AuthorityList &authorities() const override {
      return authorities_;
    }

   private:
    outcome::result<void> loadFromJson(const std::string &file_path);
    outcome::result<void> loadFields(const boost::property_tree::ptree &tree);
    outcome::result<void> loadGenesis(const boost::property_tree::ptree &tree);
    outcome::result<void> loadAuthorities(
        const boost::property_tree::ptree &tree);

    template <typename T>
    outcome::result<std::decay_t<T>> ensure(std::string_view entry_name,
                                            boost::optional<T> opt_entry) {
      if (not opt_entry) {
        log_->error("Required '{}' entry not found in the chain spec",
                    entry_name);
        return Error::MISSING_ENTRY;
      }
      return opt_entry.value();
    }

    ChainSpecImpl() = default;

    std::string name_;
    std::string id_;
    std::string config_path_;
    std::optional<consensus::TimePoint> genesis_time_;
    consensus::Duration slot_duration_{};
    primitives::Payload genesis_payload_;
    std::optional<primitives::Payload> genesis_metadata_;
    primitives::AuthorityList authorities_;
    log::Logger log_ = log::createLogger("ChainSpec", "application");
  };

}  // namespace dynpoa::application

OUTCOME_HPP_DECLARE_ERROR(dynpoa::application, ChainSpecImpl::Error)
