/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <optional>

#include <soralog/impl/configurator_from_yaml.hpp>

#include "outcome/outcome.hpp"

namespace dynpoa::log {

  enum class ConfiguratorError : uint8_t {
    NO_SUCH_CONFIG_FILE = 1,
    MALFORMED_ARGUMENTS,
  };

  /**
   * Declares the dynpoa group tree with its console sink. A user supplied
   * YAML file, if any, is applied on top of it.
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    Configurator();

    /// Applies the group tree after {@param previous}
    explicit Configurator(std::shared_ptr<soralog::Configurator> previous);

    /// Applies the YAML at {@param path} after the group tree
    explicit Configurator(std::filesystem::path path);

    /**
     * Looks for `--logcfg <path>` among the command line arguments,
     * {@param argv}[0] is the program name
     * @return path of an existing regular file, nullopt if the option is
     * absent, MALFORMED_ARGUMENTS if the option has no value or is repeated
     */
    static outcome::result<std::optional<std::filesystem::path>>
    findConfigFile(int argc, const char **argv);
  };

}  // namespace dynpoa::log

OUTCOME_HPP_DECLARE_ERROR(dynpoa::log, ConfiguratorError);
