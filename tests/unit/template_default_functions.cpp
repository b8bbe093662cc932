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

#include "expr/context.hpp"
#include "expr/interpret.hpp"
#include "templating/default_functions.hpp"
#include "templating/exceptions.hpp"
#include "utils/temporal.hpp"

using trellis::expr::Context;
using trellis::expr::Interpret;
using trellis::expr::TypedValue;
using namespace trellis::templating;

namespace {

TypedValue MakeMeta() {
  TypedValue::TMap meta;
  meta.emplace("title", TypedValue("T"));
  meta.emplace("secret", TypedValue("s"));
  meta.emplace("tags", TypedValue(TypedValue::TList{}));
  return TypedValue(std::move(meta));
}

std::vector<std::string> Keys(const TypedValue &map) {
  std::vector<std::string> keys;
  for (const auto &[key, _] : map.Items()) keys.push_back(key.ValueString());
  return keys;
}

}  // namespace

TEST(DefaultFunctions, FilterKeys) {
  auto meta = MakeMeta();
  EXPECT_EQ(Keys(FilterKeys(meta, {"-secret", "*"})), (std::vector<std::string>{"title", "tags"}));
  EXPECT_EQ(Keys(FilterKeys(meta, {"t*"})), (std::vector<std::string>{"title", "tags"}));
  EXPECT_EQ(Keys(FilterKeys(meta, {"*", "-secret"})), (std::vector<std::string>{"title", "secret", "tags"}));
  EXPECT_EQ(Keys(FilterKeys(meta, {"?itle", "secre[st]"})), (std::vector<std::string>{"title", "secret"}));
  EXPECT_TRUE(Keys(FilterKeys(meta, {})).empty());
  EXPECT_THROW(FilterKeys(meta, {""}), TemplateFunctionException);
}

TEST(DefaultFunctions, FilterKeysKeepsValues) {
  auto meta = MakeMeta();
  auto filtered = FilterKeys(meta, {"title", "tags"});
  EXPECT_EQ(filtered.GetMember("title").ValueString(), "T");
  // Containers are shared with the source, not copied.
  EXPECT_TRUE((filtered.GetMember("tags") == meta.GetMember("tags")).ValueBool());
}

TEST(DefaultFunctions, FilterKeysOfList) {
  TypedValue list(TypedValue::TList{TypedValue("a"), TypedValue("b")});
  auto filtered = FilterKeys(list, {"1"});
  ASSERT_TRUE(filtered.IsMap());
  EXPECT_EQ(filtered.GetMember("1").ValueString(), "b");
}

TEST(DefaultFunctions, FormatDate) {
  EXPECT_EQ(FormatDate("2024-03-15"), "03/15/2024");
  EXPECT_EQ(FormatDate("2024-03-15T10:20:30Z"), "03/15/2024");
  EXPECT_EQ(FormatDate("2024-03"), "2024-03");
  EXPECT_EQ(FormatDate(""), "");
}

TEST(DefaultFunctions, DayOfWeek) {
  EXPECT_EQ(DayOfWeek("2024-01-01"), "Monday");
  EXPECT_EQ(DayOfWeek("2000-02-29T08:00:00Z"), "Tuesday");
  EXPECT_THROW(DayOfWeek("yesterday"), trellis::utils::temporal::InvalidArgumentException);
}

TEST(DefaultFunctions, FormatTime) {
  EXPECT_EQ(FormatTime("2024-01-01T13:05:09Z"), "1:05 PM");
  EXPECT_EQ(FormatTime("2024-01-01T12:30:00Z"), "12:30 PM");
  EXPECT_EQ(FormatTime("2024-01-01T09:45:00Z"), "9:45 AM");
  // Midnight keeps the hour as 0.
  EXPECT_EQ(FormatTime("2024-01-01T00:07:00Z"), "0:07 AM");
  EXPECT_EQ(FormatTime("2024-01-01T13:05:09"), "2024-01-01T13:05:09");
  EXPECT_THROW(FormatTime("2024-01-01T25:00:00Z"), trellis::utils::temporal::InvalidArgumentException);
}

TEST(DefaultFunctions, BoundInContext) {
  Context context;
  context.Set("meta", MakeMeta());
  AddDefaultFunctions(context);

  EXPECT_EQ(Interpret("encodeURIComponent('a b&c')", context).ValueString(), "a%20b%26c");
  EXPECT_EQ(Interpret("'2024-03-15' |> formatDate", context).ValueString(), "03/15/2024");
  EXPECT_EQ(Interpret("dayOfWeek('2024-01-01')", context).ValueString(), "Monday");
  EXPECT_EQ(Interpret("formatTime('2024-01-01T18:00:00Z')", context).ValueString(), "6:00 PM");
  EXPECT_EQ(Interpret("filterKeys(meta, 'ti*')", context).ToText(), R"({"title":"T"})");
  EXPECT_EQ(Interpret("meta |> filterKeys(['-secret', '*'])", context).ToText(), R"({"title":"T","tags":[]})");
  EXPECT_EQ(Interpret("filterKeys()", context).ToText(), "{}");
}

TEST(DefaultFunctions, MetaAndDataDefaults) {
  Context context;
  context.Set("data", TypedValue());
  AddDefaultFunctions(context);
  EXPECT_TRUE(context.Get("meta").IsMap());
  EXPECT_TRUE(context.Get("data").IsMap());
  EXPECT_TRUE(Interpret("meta.anything", context).IsNull());

  Context bound;
  bound.Set("meta", MakeMeta());
  AddDefaultFunctions(bound);
  EXPECT_EQ(Interpret("meta.title", bound).ValueString(), "T");
}

TEST(DefaultFunctions, ParentBindingsAreKept) {
  Context parent;
  parent.Set("data", TypedValue(TypedValue::TMap{{"x", TypedValue(1)}}));
  Context child(&parent);
  AddDefaultFunctions(child);
  EXPECT_FALSE(child.ContainsLocal("data"));
  EXPECT_EQ(Interpret("data.x", child).ValueInt(), 1);
}
