/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using dynpoa::log::Level;
using dynpoa::log::LoggerError;
using dynpoa::log::parseLevel;
using dynpoa::log::parseLevelOverride;
using dynpoa::log::tuneLoggingSystem;

class LoggerTest : public testing::Test {
 public:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void TearDown() override {
    dynpoa::log::setLevelOfGroup(dynpoa::log::kRootGroup, Level::INFO);
    dynpoa::log::setLevelOfGroup("poa", Level::INFO);
  }
};

/**
 * @given full and short level names
 * @when they are parsed
 * @then matching soralog levels are returned
 */
TEST_F(LoggerTest, ParseLevel) {
  EXPECT_OUTCOME_TRUE(trace, parseLevel("trace"));
  EXPECT_EQ(trace, Level::TRACE);
  EXPECT_OUTCOME_TRUE(warn, parseLevel("warn"));
  EXPECT_EQ(warn, Level::WARN);
  EXPECT_OUTCOME_TRUE(off, parseLevel("off"));
  EXPECT_EQ(off, Level::OFF);

  EXPECT_EC(parseLevel("loud"), LoggerError::UNKNOWN_LEVEL);
  EXPECT_EC(parseLevel("TRACE"), LoggerError::UNKNOWN_LEVEL);
}

TEST_F(LoggerTest, ParseOverride) {
  EXPECT_OUTCOME_TRUE(root, parseLevelOverride("debug"));
  EXPECT_FALSE(root.group.has_value());
  EXPECT_EQ(root.level, Level::DEBUG);

  EXPECT_OUTCOME_TRUE(poa, parseLevelOverride(" poa = trace "));
  ASSERT_TRUE(poa.group.has_value());
  EXPECT_EQ(poa.group.value(), "poa");
  EXPECT_EQ(poa.level, Level::TRACE);

  EXPECT_EC(parseLevelOverride("=trace"), LoggerError::MALFORMED_OVERRIDE);
  EXPECT_EC(parseLevelOverride("poa="), LoggerError::MALFORMED_OVERRIDE);
  EXPECT_EC(parseLevelOverride("poa=loud"), LoggerError::UNKNOWN_LEVEL);
}

/**
 * @given logging system with the dynpoa group tree
 * @when overrides are applied
 * @then levels of the named groups change, unknown group is reported
 */
TEST_F(LoggerTest, Tune) {
  auto logger = dynpoa::log::createLogger("LoggerTest", "poa");

  EXPECT_OUTCOME_TRUE_1(tuneLoggingSystem({"poa=trace"}));
  EXPECT_EQ(logger->level(), Level::TRACE);

  EXPECT_OUTCOME_TRUE_1(tuneLoggingSystem({"poa=error"}));
  EXPECT_EQ(logger->level(), Level::ERROR);

  EXPECT_EC(tuneLoggingSystem({"gossip=trace"}), LoggerError::UNKNOWN_GROUP);
  EXPECT_EC(tuneLoggingSystem({"poa:trace"}), LoggerError::UNKNOWN_LEVEL);
}
