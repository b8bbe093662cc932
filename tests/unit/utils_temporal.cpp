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

#include <string_view>

#include <gtest/gtest.h>

#include "utils/exceptions.hpp"
#include "utils/temporal.hpp"

using trellis::utils::DateParameters;
using trellis::utils::LocalTimeParameters;

TEST(TemporalTest, DateParsing) {
  ASSERT_EQ(trellis::utils::ParseDateParameters("2020-11-22"), (DateParameters{2020, 11, 22}));
  ASSERT_EQ(trellis::utils::ParseDateParameters("0001-01-01"), (DateParameters{1, 1, 1}));
  ASSERT_EQ(trellis::utils::ParseDateParameters("2024-02-29"), (DateParameters{2024, 2, 29}));

  ASSERT_THROW(trellis::utils::ParseDateParameters("202-011-22"), trellis::utils::BasicException);
  ASSERT_THROW(trellis::utils::ParseDateParameters("2020-1-022"), trellis::utils::BasicException);
  ASSERT_THROW(trellis::utils::ParseDateParameters("2020-11-2-"), trellis::utils::BasicException);
  ASSERT_THROW(trellis::utils::ParseDateParameters("2020-13-01"), trellis::utils::BasicException);
  ASSERT_THROW(trellis::utils::ParseDateParameters("2021-02-29"), trellis::utils::BasicException);
  ASSERT_THROW(trellis::utils::ParseDateParameters("20201122"), trellis::utils::temporal::InvalidArgumentException);
}

TEST(TemporalTest, LocalTimeParsing) {
  ASSERT_EQ(trellis::utils::ParseLocalTimeParameters("19:20:21"), (LocalTimeParameters{19, 20, 21}));
  ASSERT_EQ(trellis::utils::ParseLocalTimeParameters("00:00:00"), (LocalTimeParameters{0, 0, 0}));

  ASSERT_THROW(trellis::utils::ParseLocalTimeParameters("19:20:21s"), trellis::utils::BasicException);
  ASSERT_THROW(trellis::utils::ParseLocalTimeParameters("1920:21"), trellis::utils::BasicException);
  ASSERT_THROW(trellis::utils::ParseLocalTimeParameters("24:00:00"), trellis::utils::BasicException);
  ASSERT_THROW(trellis::utils::ParseLocalTimeParameters("12:60:00"), trellis::utils::BasicException);
}

TEST(TemporalTest, DayOfWeekName) {
  EXPECT_EQ(trellis::utils::DayOfWeekName({2024, 1, 1}), "Monday");
  EXPECT_EQ(trellis::utils::DayOfWeekName({2000, 2, 29}), "Tuesday");
  EXPECT_EQ(trellis::utils::DayOfWeekName({2023, 12, 31}), "Sunday");
  EXPECT_EQ(trellis::utils::DayOfWeekName({1970, 1, 1}), "Thursday");
}
