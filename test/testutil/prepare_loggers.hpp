/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <stdexcept>

#include <soralog/impl/configurator_from_yaml.hpp>

#include "log/configurator.hpp"
#include "log/logger.hpp"

namespace testutil {

  /**
   * Console sink without buffering, `testing` group traces everything.
   * The dynpoa group tree is declared on top of it.
   */
  inline std::shared_ptr<soralog::LoggingSystem> makeTestingLoggingSystem() {
    static const std::string kTestingConfig(R"(
sinks:
  - name: console
    type: console
    capacity: 4
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: testing
        level: trace
)");
    auto logging_system = std::make_shared<soralog::LoggingSystem>(
        std::make_shared<dynpoa::log::Configurator>(
            std::make_shared<soralog::ConfiguratorFromYAML>(kTestingConfig)));
    auto r = logging_system->configure();
    if (r.has_error) {
      throw std::runtime_error("Can't configure logging system: " + r.message);
    }
    return logging_system;
  }

  // call it in SetUpTestCase
  inline void prepareLoggers(soralog::Level level = soralog::Level::INFO) {
    static const auto logging_system = [] {
      auto system = makeTestingLoggingSystem();
      dynpoa::log::setLoggingSystem(system);
      return system;
    }();
    logging_system->setLevelOfGroup(dynpoa::log::kRootGroup, level);
  }

}  // namespace testutil
