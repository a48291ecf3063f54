/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gtest/gtest.h>

#include "outcome/outcome.hpp"

#define _EXPECT_OUTCOME_TRUE_IMPL(tmp, expr)                                 \
  auto &&tmp = expr;                                                         \
  EXPECT_TRUE(tmp.has_value())                                               \
      << "Line " << __LINE__ << ": "                                         \
      << (tmp.has_error() ? tmp.error().message() : std::string{});

/// Expects {@param expr} to succeed, the result is discarded
#define EXPECT_OUTCOME_TRUE_1(expr) \
  _EXPECT_OUTCOME_TRUE_IMPL(OUTCOME_UNIQUE, expr)

#define _EXPECT_OUTCOME_TRUE_NAME(tmp, val, expr) \
  _EXPECT_OUTCOME_TRUE_IMPL(tmp, expr)            \
  auto &&val = tmp.value();

/**
 * Expects {@param expr} to succeed and binds its value to {@param val}:
 * EXPECT_OUTCOME_TRUE(block, engine->createBlock(...));
 */
#define EXPECT_OUTCOME_TRUE(val, expr) \
  _EXPECT_OUTCOME_TRUE_NAME(OUTCOME_UNIQUE, val, expr)

#define _EXPECT_EC(tmp, expr, expected) \
  auto &&tmp = expr;                    \
  EXPECT_TRUE(tmp.has_error());         \
  EXPECT_EQ(tmp.error(), expected);

/// Expects {@param expr} to fail with error code {@param expected}
#define EXPECT_EC(expr, expected) _EXPECT_EC(OUTCOME_UNIQUE, expr, expected)
