// Copyright 2025 Memgraph Ltd.
//
// Use of this software is governed by the Business Source License
// included in the file licenses/BSL.txt; by using this file, you agree to be bound by the terms of the Business Source
// License, and you may not use this file except in compliance with the Business Source License.
//
// As of the Change Date specified in that file, in accordance with
// the Business Source License, use of this software will be governed
// by the Apache License, Version 2.0, included in the file
// licenses/APL.txt.

#include <gtest/gtest.h>

#include <spdlog/spdlog.h>

#include "flags/log_level.hpp"

TEST(LogLevel, Validation) {
  EXPECT_TRUE(trellis::flags::ValidLogLevel("TRACE"));
  EXPECT_TRUE(trellis::flags::ValidLogLevel("WARNING"));
  EXPECT_TRUE(trellis::flags::ValidLogLevel("CRITICAL"));
  EXPECT_FALSE(trellis::flags::ValidLogLevel(""));
  EXPECT_FALSE(trellis::flags::ValidLogLevel("trace"));
  EXPECT_FALSE(trellis::flags::ValidLogLevel("VERBOSE"));
}

TEST(LogLevel, ToEnum) {
  EXPECT_EQ(trellis::flags::LogLevelToEnum("DEBUG"), spdlog::level::debug);
  EXPECT_EQ(trellis::flags::LogLevelToEnum("WARNING"), spdlog::level::warn);
  EXPECT_EQ(trellis::flags::LogLevelToEnum("ERROR"), spdlog::level::err);
  EXPECT_FALSE(trellis::flags::LogLevelToEnum("NOPE"));
}

TEST(LogLevel, InitializeLogger) {
  FLAGS_log_level = "ERROR";
  FLAGS_also_log_to_stderr = true;
  trellis::flags::InitializeLogger();
  auto logger = spdlog::default_logger();
  EXPECT_EQ(logger->name(), "trellis_log");
  EXPECT_EQ(logger->level(), spdlog::level::err);
  ASSERT_EQ(logger->sinks().size(), 1);
  EXPECT_EQ(logger->sinks().front()->level(), spdlog::level::err);

  trellis::flags::LogToStderr(spdlog::level::off);
  EXPECT_EQ(logger->sinks().front()->level(), spdlog::level::off);
}
