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

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string_view>

#include "utils/exceptions.hpp"

namespace trellis::utils {

namespace temporal {
struct InvalidArgumentException : public utils::BasicException {
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(InvalidArgumentException)
};
}  // namespace temporal

struct DateParameters {
  int64_t year{0};
  int64_t month{1};
  int64_t day{1};

  bool operator==(const DateParameters &) const = default;
};

/// Parses an extended ISO 8601 date, `YYYY-MM-DD`.
/// @throw temporal::InvalidArgumentException
DateParameters ParseDateParameters(std::string_view date_string);

struct LocalTimeParameters {
  int64_t hour{0};
  int64_t minute{0};
  int64_t second{0};

  bool operator==(const LocalTimeParameters &) const = default;
};

/// Parses an extended ISO 8601 time, `HH:MM:SS`.
/// @throw temporal::InvalidArgumentException
LocalTimeParameters ParseLocalTimeParameters(std::string_view local_time_string);

inline constexpr std::array<std::string_view, 7> kDaysOfWeekFullNames{"Sunday",   "Monday", "Tuesday", "Wednesday",
                                                                      "Thursday", "Friday", "Saturday"};

constexpr std::chrono::year_month_day ToChronoYMD(int64_t year, int64_t month, int64_t day) {
  namespace chrono = std::chrono;
  return chrono::year_month_day(chrono::year(static_cast<int>(year)), chrono::month(static_cast<unsigned>(month)),
                                chrono::day(static_cast<unsigned>(day)));
}

/// Full English name of the weekday the date falls on.
std::string_view DayOfWeekName(const DateParameters &date);

}  // namespace trellis::utils
