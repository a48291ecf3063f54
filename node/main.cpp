/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <iostream>

#include <libp2p/common/final_action.hpp>

#include "application/impl/app_configuration_impl.hpp"
#include "application/impl/chain_spec_impl.hpp"
#include "clock/impl/clock_impl.hpp"
#include "consensus/poa/impl/proof_of_authority_impl.hpp"
#include "log/configurator.hpp"
#include "log/logger.hpp"

using dynpoa::application::AppConfigurationImpl;
using dynpoa::application::ChainSpecImpl;
using dynpoa::consensus::poa::ProofOfAuthorityImpl;

namespace {

  /**
   * Authors {@param blocks} consecutive slots following the last block,
   * each one by its scheduled leader at the start time of the slot
   */
  bool author_slots(dynpoa::consensus::poa::ProofOfAuthority &engine,
                    const std::string &chain_id,
                    uint32_t blocks,
                    const dynpoa::log::Logger &logger) {
    auto first_slot = engine.lastBlock().slot + 1;
    for (auto slot = first_slot; slot < first_slot + blocks; ++slot) {
      auto leader_res = engine.authorityForSlot(slot);
      if (leader_res.has_error()) {
        SL_ERROR(logger,
                 "No leader for slot {}: {}",
                 slot,
                 leader_res.error().message());
        return false;
      }
      const auto &leader = leader_res.value();

      dynpoa::primitives::Payload payload{
          {"chain", chain_id},
          {"slot", slot},
      };
      auto block_res = engine.createBlock(
          leader.id, std::move(payload), engine.slotStartTime(slot), {});
      if (block_res.has_error()) {
        SL_ERROR(logger,
                 "{} can not create block for slot {}: {}",
                 leader.id,
                 slot,
                 block_res.error().message());
        return false;
      }

      auto submit_res = engine.submitBlock(std::move(block_res.value()));
      if (submit_res.has_error()) {
        SL_ERROR(logger,
                 "Block of slot {} is not accepted: {}",
                 slot,
                 submit_res.error().message());
        return false;
      }
    }
    return true;
  }

  int run_node(int argc, const char **argv) {
    auto logger = dynpoa::log::createLogger("Main");

    auto configuration = std::make_shared<AppConfigurationImpl>(
        dynpoa::log::createLogger("AppConfiguration", "application"));

    if (not configuration->initializeFromArgs(argc, argv)) {
      return EXIT_FAILURE;
    }

    if (auto res = dynpoa::log::tuneLoggingSystem(configuration->log());
        res.has_error()) {
      SL_CRITICAL(logger, "Wrong --log value: {}", res.error().message());
      return EXIT_FAILURE;
    }

    auto chain_spec_res =
        ChainSpecImpl::loadFrom(configuration->chainSpecPath().native());
    if (chain_spec_res.has_error()) {
      SL_CRITICAL(logger,
                  "Can not load chain spec {}: {}",
                  configuration->chainSpecPath().native(),
                  chain_spec_res.error().message());
      return EXIT_FAILURE;
    }
    auto &chain_spec = chain_spec_res.value();

    auto clock = std::make_shared<dynpoa::clock::SystemClockImpl>();
    auto engine_res =
        ProofOfAuthorityImpl::create(chain_spec->engineConfig(), clock);
    if (engine_res.has_error()) {
      SL_CRITICAL(logger,
                  "Can not start engine of chain '{}': {}",
                  chain_spec->name(),
                  engine_res.error().message());
      return EXIT_FAILURE;
    }
    auto &engine = engine_res.value();

    SL_INFO(logger,
            "Chain '{}' ({}) started with {} active authorities",
            chain_spec->name(),
            chain_spec->id(),
            engine->activeAuthorities().size());

    if (not author_slots(*engine,
                         chain_spec->id(),
                         configuration->blocksToProduce(),
                         logger)) {
      return EXIT_FAILURE;
    }

    if (auto res = engine->validateChain(); res.has_error()) {
      SL_CRITICAL(logger, "Chain is invalid: {}", res.error().message());
      return EXIT_FAILURE;
    }
    SL_INFO(logger, "Chain of {} blocks is valid", engine->height());

    if (configuration->printSnapshot()) {
      std::cout << dynpoa::consensus::poa::snapshotToJson(engine->snapshot(),
                                                          true)
                << std::endl;
    }

    return EXIT_SUCCESS;
  }

}  // namespace

int main(int argc, const char **argv) {
  libp2p::common::FinalAction flush_std_streams_at_exit([] {
    std::cout.flush();
    std::cerr.flush();
  });

  auto log_config_res =
      dynpoa::log::Configurator::findConfigFile(argc, argv);
  if (log_config_res.has_error()) {
    std::cerr << log_config_res.error().message() << '\n';
    return EXIT_FAILURE;
  }
  const auto &log_config_path = log_config_res.value();

  auto logging_system = std::make_shared<soralog::LoggingSystem>(
      log_config_path.has_value()
          ? std::make_shared<dynpoa::log::Configurator>(log_config_path.value())
          : std::make_shared<dynpoa::log::Configurator>());

  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << '\n';
  }
  if (r.has_error) {
    return EXIT_FAILURE;
  }

  dynpoa::log::setLoggingSystem(logging_system);

  auto exit_code = run_node(argc, argv);

  auto logger = dynpoa::log::createLogger("Main");
  SL_INFO(logger, "All components are stopped");
  logger->flush();

  return exit_code;
}
