/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "application/app_configuration.hpp"

#include <rapidjson/document.h>

#include "log/logger.hpp"

namespace dynpoa::application {

  /**
   * Configuration from the command line and an optional JSON file given by
   * `--config-file`. The file consists of `general`, `blockchain` and
   * `development` segments, values of the command line win over it.
   */
  class AppConfigurationImpl final : public AppConfiguration {
   public:
    static constexpr uint32_t kDefaultBlocksToProduce = 10;

    explicit AppConfigurationImpl(log::Logger logger);

    AppConfigurationImpl(const AppConfigurationImpl &) = delete;
    AppConfigurationImpl &operator=(const AppConfigurationImpl &) = delete;

    /// @return false if arguments are wrong or help was requested
    [[nodiscard]] bool initializeFromArgs(int argc, const char **argv);

    std::filesystem::path chainSpecPath() const override {
      return chain_spec_path_;
    }

    const std::vector<std::string> &log() const override {
      return log_overrides_;
    }

    uint32_t blocksToProduce() const override {
      return blocks_to_produce_;
    }

    bool printSnapshot() const override {
      return print_snapshot_;
    }

   private:
    using SegmentParser =
        void (AppConfigurationImpl::*)(const rapidjson::Value &);

    void parseGeneral(const rapidjson::Value &segment);
    void parseBlockchain(const rapidjson::Value &segment);
    void parseDevelopment(const rapidjson::Value &segment);

    bool loadConfigFile(const std::filesystem::path &path);
    bool validate() const;

    log::Logger logger_;

    std::filesystem::path chain_spec_path_;
    std::vector<std::string> log_overrides_;
    uint32_t blocks_to_produce_ = kDefaultBlocksToProduce;
    bool print_snapshot_ = false;
  };

}  // namespace dynpoa::application
