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

#include "utils/temporal.hpp"

#include <charconv>
#include <optional>

namespace trellis::utils {
namespace {

constexpr bool IsInBounds(const auto low, const auto high, const auto value) { return low <= value && value <= high; }

template <typename T>
std::optional<T> ParseNumber(const std::string_view string, const size_t size) {
  if (string.size() < size) {
    return std::nullopt;
  }

  T value{};
  if (const auto [p, ec] = std::from_chars(string.data(), string.data() + size, value);
      ec != std::errc() || p != string.data() + size) {
    return std::nullopt;
  }

  return value;
}

constexpr std::string_view kSupportedDateFormatsHelpMessage = "Expected a date in the YYYY-MM-DD format.";
constexpr std::string_view kSupportedTimeFormatsHelpMessage = "Expected a time in the hh:mm:ss format.";

}  // namespace

DateParameters ParseDateParameters(std::string_view date_string) {
  // https://en.wikipedia.org/wiki/ISO_8601#Dates
  if (date_string.size() != 10 || date_string[4] != '-' || date_string[7] != '-') {
    throw temporal::InvalidArgumentException("Invalid string for date. {}", kSupportedDateFormatsHelpMessage);
  }

  DateParameters date_parameters;
  auto maybe_year = ParseNumber<int64_t>(date_string, 4);
  if (!maybe_year) {
    throw temporal::InvalidArgumentException("Invalid year in the string. {}", kSupportedDateFormatsHelpMessage);
  }
  date_parameters.year = *maybe_year;
  date_string.remove_prefix(5);

  auto maybe_month = ParseNumber<int64_t>(date_string, 2);
  if (!maybe_month || !IsInBounds(1, 12, *maybe_month)) {
    throw temporal::InvalidArgumentException("Invalid month in the string. {}", kSupportedDateFormatsHelpMessage);
  }
  date_parameters.month = *maybe_month;
  date_string.remove_prefix(3);

  auto maybe_day = ParseNumber<int64_t>(date_string, 2);
  if (!maybe_day || !ToChronoYMD(date_parameters.year, date_parameters.month, *maybe_day).ok()) {
    throw temporal::InvalidArgumentException("Invalid day in the string. {}", kSupportedDateFormatsHelpMessage);
  }
  date_parameters.day = *maybe_day;

  return date_parameters;
}

LocalTimeParameters ParseLocalTimeParameters(std::string_view local_time_string) {
  if (local_time_string.size() != 8 || local_time_string[2] != ':' || local_time_string[5] != ':') {
    throw temporal::InvalidArgumentException("Invalid string for time. {}", kSupportedTimeFormatsHelpMessage);
  }

  LocalTimeParameters parameters;
  const auto parse_component = [&](const size_t offset, const int64_t upper_bound, const std::string_view what) {
    auto maybe_value = ParseNumber<int64_t>(local_time_string.substr(offset), 2);
    if (!maybe_value || !IsInBounds(0, upper_bound, *maybe_value)) {
      throw temporal::InvalidArgumentException("Invalid {} in the string. {}", what, kSupportedTimeFormatsHelpMessage);
    }
    return *maybe_value;
  };
  parameters.hour = parse_component(0, 23, "hour");
  parameters.minute = parse_component(3, 59, "minutes");
  parameters.second = parse_component(6, 59, "seconds");
  return parameters;
}

std::string_view DayOfWeekName(const DateParameters &date) {
  namespace chrono = std::chrono;
  const auto weekday = chrono::weekday(chrono::sys_days(ToChronoYMD(date.year, date.month, date.day)));
  return kDaysOfWeekFullNames[weekday.c_encoding()];
}

}  // namespace trellis::utils
