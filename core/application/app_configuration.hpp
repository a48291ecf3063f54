/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace dynpoa::application {

  /**
   * Parse and store application config.
   */
  class AppConfiguration {
   public:
    virtual ~AppConfiguration() = default;

    /**
     * @return file path with chain specification
     */
    virtual std::filesystem::path chainSpecPath() const = 0;

    /**
     * @return logging overrides, `level` or `group=level`
     */
    virtual const std::vector<std::string> &log() const = 0;

    /**
     * @return number of slots authored in development mode
     */
    virtual uint32_t blocksToProduce() const = 0;

    /**
     * @return true if the engine snapshot must be printed on exit
     */
    virtual bool printSnapshot() const = 0;
  };

}  // namespace dynpoa::application
