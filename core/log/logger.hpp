/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <qtils/strict_sptr.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

#include "outcome/outcome.hpp"

namespace dynpoa::log {

  using Level = soralog::Level;
  using Logger = qtils::StrictSharedPtr<soralog::Logger>;

  enum class LoggerError : uint8_t {
    UNKNOWN_LEVEL = 1,
    UNKNOWN_GROUP,
    MALFORMED_OVERRIDE,
  };

  /// Root group of every logger created by the node
  inline const std::string kRootGroup = "dynpoa";

  /**
   * Level override given as `level` (applied to the root group) or
   * `group=level`
   */
  struct LevelOverride {
    std::optional<std::string> group;
    Level level;
  };

  outcome::result<Level> parseLevel(std::string_view str);

  outcome::result<LevelOverride> parseLevelOverride(std::string_view str);

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system);

  /**
   * Applies overrides in the given order. Stops at the first one which can
   * not be parsed or names an unknown group.
   */
  outcome::result<void> tuneLoggingSystem(
      const std::vector<std::string> &overrides);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group = kRootGroup);

  bool setLevelOfGroup(const std::string &group_name, Level level);

}  // namespace dynpoa::log

OUTCOME_HPP_DECLARE_ERROR(dynpoa::log, LoggerError);
