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

#include "templating/default_functions.hpp"

#include <fnmatch.h>

#include "templating/exceptions.hpp"
#include "utils/temporal.hpp"
#include "utils/uri.hpp"

namespace trellis::templating {

namespace {

using expr::TypedValue;

std::string ArgumentText(const std::vector<TypedValue> &args, size_t index) {
  return index < args.size() ? args[index].ToText() : std::string();
}

bool GlobMatch(const std::string &text, const std::string &pattern) {
  return fnmatch(pattern.c_str(), text.c_str(), 0) == 0;
}

std::vector<std::string> ToFilterList(const TypedValue &filters) {
  std::vector<std::string> result;
  if (filters.IsString()) {
    result.push_back(filters.ValueString());
    return result;
  }
  for (const auto &[_, filter] : filters.Items()) result.push_back(filter.ToText());
  return result;
}

}  // namespace

TypedValue FilterKeys(const TypedValue &object, const std::vector<std::string> &filters) {
  TypedValue::TMap result;
  for (const auto &[key, value] : object.Items()) {
    const auto name = key.ToText();
    bool keep = false;
    for (const auto &filter : filters) {
      if (filter.empty()) throw TemplateFunctionException("filterKeys: a filter can't be empty");
      const bool reject = filter.front() == '-';
      if (GlobMatch(name, reject ? filter.substr(1) : filter)) {
        keep = !reject;
        break;
      }
    }
    if (keep) result[name] = value;
  }
  return TypedValue(std::move(result));
}

std::string FormatDate(std::string_view date) {
  if (date.size() < 10) return std::string(date);
  return fmt::format("{}/{}/{}", date.substr(5, 2), date.substr(8, 2), date.substr(0, 4));
}

std::string DayOfWeek(std::string_view date) {
  return std::string(utils::DayOfWeekName(utils::ParseDateParameters(date.substr(0, 10))));
}

std::string FormatTime(std::string_view date_time) {
  if (date_time.size() < 20) return std::string(date_time);
  auto time = utils::ParseLocalTimeParameters(date_time.substr(11, 8));
  const auto *meridiem = time.hour >= 12 ? "PM" : "AM";
  auto hour = time.hour > 12 ? time.hour - 12 : time.hour;
  return fmt::format("{}:{:02} {}", hour, time.minute, meridiem);
}

void AddDefaultFunctions(expr::Context &context) {
  context.Set("filterKeys", TypedValue(TypedValue::TFunction([](const TypedValue &, std::vector<TypedValue> args) {
                if (args.empty()) return TypedValue(TypedValue::TMap{});
                auto filters = args.size() > 1 ? ToFilterList(args[1]) : std::vector<std::string>{};
                return FilterKeys(args[0], filters);
              })));
  context.Set("encodeURIComponent",
              TypedValue(TypedValue::TFunction([](const TypedValue &, std::vector<TypedValue> args) {
                return TypedValue(utils::EncodeUriComponent(ArgumentText(args, 0)));
              })));
  context.Set("formatDate", TypedValue(TypedValue::TFunction([](const TypedValue &, std::vector<TypedValue> args) {
                return TypedValue(FormatDate(ArgumentText(args, 0)));
              })));
  context.Set("dayOfWeek", TypedValue(TypedValue::TFunction([](const TypedValue &, std::vector<TypedValue> args) {
                return TypedValue(DayOfWeek(ArgumentText(args, 0)));
              })));
  context.Set("formatTime", TypedValue(TypedValue::TFunction([](const TypedValue &, std::vector<TypedValue> args) {
                return TypedValue(FormatTime(ArgumentText(args, 0)));
              })));

  // Templates may read `meta.x` and `data.x` without checking for null.
  for (const auto *name : {"meta", "data"}) {
    const auto *value = context.Find(name);
    if (!value || value->IsNull()) context.Set(name, TypedValue(TypedValue::TMap{}));
  }
}

}  // namespace trellis::templating
