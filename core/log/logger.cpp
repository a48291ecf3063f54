/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <array>
#include <utility>

#include <boost/algorithm/string/trim.hpp>
#include <boost/assert.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(dynpoa::log, LoggerError, e) {
  using E = dynpoa::log::LoggerError;
  switch (e) {
    case E::UNKNOWN_LEVEL:
      return "Unknown log level";
    case E::UNKNOWN_GROUP:
      return "Unknown log group";
    case E::MALFORMED_OVERRIDE:
      return "Log level override must look like 'level' or 'group=level'";
  }
  return "Unknown log::LoggerError";
}

namespace dynpoa::log {

  namespace {
    // NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
    std::weak_ptr<soralog::LoggingSystem> logging_system_;

    std::shared_ptr<soralog::LoggingSystem> loggingSystem() {
      auto logging_system = logging_system_.lock();
      BOOST_ASSERT_MSG(logging_system,
                       "dynpoa::log::setLoggingSystem() must be called "
                       "before any logger is used");
      return logging_system;
    }

    constexpr std::array<std::pair<std::string_view, Level>, 14> kLevelNames{{
        {"trace", Level::TRACE},
        {"debug", Level::DEBUG},
        {"verbose", Level::VERBOSE},
        {"info", Level::INFO},
        {"inf", Level::INFO},
        {"warning", Level::WARN},
        {"warn", Level::WARN},
        {"error", Level::ERROR},
        {"err", Level::ERROR},
        {"critical", Level::CRITICAL},
        {"crit", Level::CRITICAL},
        {"off", Level::OFF},
        {"no", Level::OFF},
        {"none", Level::OFF},
    }};
  }  // namespace

  outcome::result<Level> parseLevel(std::string_view str) {
    for (auto &[name, level] : kLevelNames) {
      if (name == str) {
        return level;
      }
    }
    return LoggerError::UNKNOWN_LEVEL;
  }

  outcome::result<LevelOverride> parseLevelOverride(std::string_view str) {
    auto pos = str.find('=');
    if (pos == std::string_view::npos) {
      OUTCOME_TRY(level, parseLevel(str));
      return LevelOverride{std::nullopt, level};
    }

    auto group = boost::algorithm::trim_copy(std::string(str.substr(0, pos)));
    auto level_str =
        boost::algorithm::trim_copy(std::string(str.substr(pos + 1)));
    if (group.empty() or level_str.empty()) {
      return LoggerError::MALFORMED_OVERRIDE;
    }
    OUTCOME_TRY(level, parseLevel(level_str));
    return LevelOverride{std::move(group), level};
  }

  void setLoggingSystem(std::weak_ptr<soralog::LoggingSystem> logging_system) {
    logging_system_ = std::move(logging_system);
  }

  outcome::result<void> tuneLoggingSystem(
      const std::vector<std::string> &overrides) {
    auto logging_system = loggingSystem();
    for (auto &item : overrides) {
      OUTCOME_TRY(level_override, parseLevelOverride(item));
      const auto &group = level_override.group.value_or(kRootGroup);
      if (not logging_system->getGroup(group)) {
        return LoggerError::UNKNOWN_GROUP;
      }
      logging_system->setLevelOfGroup(group, level_override.level);
    }
    return outcome::success();
  }

  Logger createLogger(const std::string &tag, const std::string &group) {
    return std::static_pointer_cast<soralog::LoggerFactory>(loggingSystem())
        ->getLogger(tag, group);
  }

  bool setLevelOfGroup(const std::string &group_name, Level level) {
    return loggingSystem()->setLevelOfGroup(group_name, level);
  }

}  // namespace dynpoa::log
