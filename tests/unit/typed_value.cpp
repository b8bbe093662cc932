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

#include <cmath>
#include <memory>
#include <string>
#include <vector>

#include "gtest/gtest.h"

#include "dom/node.hpp"
#include "expr/typed_value.hpp"

using trellis::expr::TypedValue;
using trellis::expr::TypedValueException;

void EXPECT_PROP_FALSE(const TypedValue &a) {
  ASSERT_EQ(a.type(), TypedValue::Type::Bool);
  ASSERT_FALSE(a.ValueBool());
}

void EXPECT_PROP_TRUE(const TypedValue &a) {
  ASSERT_EQ(a.type(), TypedValue::Type::Bool);
  ASSERT_TRUE(a.ValueBool());
}

void EXPECT_PROP_EQ(const TypedValue &a, const TypedValue &b) { EXPECT_PROP_TRUE(a == b); }

void EXPECT_PROP_ISNULL(const TypedValue &a) { ASSERT_TRUE(a.IsNull()); }

void EXPECT_PROP_NE(const TypedValue &a, const TypedValue &b) { EXPECT_PROP_TRUE(a != b); }

TEST(TypedValue, CreationTypes) {
  EXPECT_TRUE(TypedValue().type() == TypedValue::Type::Null);

  EXPECT_TRUE(TypedValue(true).type() == TypedValue::Type::Bool);
  EXPECT_TRUE(TypedValue(false).type() == TypedValue::Type::Bool);

  EXPECT_TRUE(TypedValue(std::string("form string class")).type() == TypedValue::Type::String);
  EXPECT_TRUE(TypedValue("form c-string").type() == TypedValue::Type::String);

  EXPECT_TRUE(TypedValue(0).type() == TypedValue::Type::Int);
  EXPECT_TRUE(TypedValue(42).type() == TypedValue::Type::Int);

  EXPECT_TRUE(TypedValue(0.0).type() == TypedValue::Type::Double);
  EXPECT_TRUE(TypedValue(42.5).type() == TypedValue::Type::Double);

  EXPECT_TRUE(TypedValue(TypedValue::TList{}).type() == TypedValue::Type::List);
  EXPECT_TRUE(TypedValue(TypedValue::TMap{}).type() == TypedValue::Type::Map);
  EXPECT_TRUE(TypedValue(TypedValue::TFunction([](const TypedValue &, std::vector<TypedValue>) { return TypedValue(); }))
                  .type() == TypedValue::Type::Function);
  EXPECT_TRUE(TypedValue::OwnNode(std::make_unique<trellis::dom::Element>("p")).type() == TypedValue::Type::Node);
}

TEST(TypedValue, CreationValues) {
  EXPECT_EQ(TypedValue(true).ValueBool(), true);
  EXPECT_EQ(TypedValue(false).ValueBool(), false);

  EXPECT_EQ(TypedValue(std::string("bla")).ValueString(), "bla");
  EXPECT_EQ(TypedValue("bla2").ValueString(), "bla2");

  EXPECT_EQ(TypedValue(55).ValueInt(), 55);

  EXPECT_FLOAT_EQ(TypedValue(66.6).ValueDouble(), 66.6);

  EXPECT_THROW(TypedValue(55).ValueString(), TypedValueException);
  EXPECT_THROW(TypedValue().ValueBool(), TypedValueException);
}

TEST(TypedValue, Equals) {
  EXPECT_PROP_EQ(TypedValue(true), TypedValue(true));
  EXPECT_PROP_NE(TypedValue(true), TypedValue(false));

  EXPECT_PROP_EQ(TypedValue(42), TypedValue(42));
  EXPECT_PROP_NE(TypedValue(0), TypedValue(1));

  // compare two ints close to 2 ^ 62
  // this will fail if they are converted to float at any point
  EXPECT_PROP_NE(TypedValue(4611686018427387905), TypedValue(4611686018427387904));

  EXPECT_PROP_NE(TypedValue(0.5), TypedValue(0.12));
  EXPECT_PROP_EQ(TypedValue(0.123), TypedValue(0.123));

  EXPECT_PROP_EQ(TypedValue(2), TypedValue(2.0));
  EXPECT_PROP_NE(TypedValue(2), TypedValue(2.1));

  EXPECT_PROP_NE(TypedValue("str1"), TypedValue("str2"));
  EXPECT_PROP_EQ(TypedValue("str3"), TypedValue("str3"));
  EXPECT_PROP_EQ(TypedValue(std::string("str3")), TypedValue("str3"));

  EXPECT_PROP_EQ(TypedValue(), TypedValue());
  EXPECT_PROP_NE(TypedValue(), TypedValue(false));
  EXPECT_PROP_NE(TypedValue("1"), TypedValue(1));
  EXPECT_PROP_NE(TypedValue(""), TypedValue(false));
}

TEST(TypedValue, ContainersCompareByIdentity) {
  TypedValue list(TypedValue::TList{TypedValue(1)});
  TypedValue same = list;
  EXPECT_PROP_EQ(list, same);
  EXPECT_PROP_NE(list, TypedValue(TypedValue::TList{TypedValue(1)}));

  TypedValue map(TypedValue::TMap{{"a", TypedValue(1)}});
  EXPECT_PROP_EQ(map, TypedValue(map));
  EXPECT_PROP_NE(map, TypedValue(TypedValue::TMap{{"a", TypedValue(1)}}));
}

TEST(TypedValue, ContainersAreShared) {
  TypedValue list(TypedValue::TList{});
  TypedValue copy = list;
  copy.ValueList().emplace_back(7);
  ASSERT_EQ(list.ValueList().size(), 1);

  TypedValue map(TypedValue::TMap{});
  TypedValue map_copy = map;
  map_copy.SetMember("key", TypedValue("value"));
  EXPECT_PROP_EQ(map.GetMember("key"), TypedValue("value"));
}

TEST(TypedValue, SelfReferencingAssignment) {
  TypedValue outer(TypedValue::TList{TypedValue(TypedValue::TList{TypedValue(1), TypedValue(2)})});
  // The right side lives inside the value being overwritten.
  outer = outer.ValueList()[0];
  ASSERT_TRUE(outer.IsList());
  EXPECT_EQ(outer.ValueList().size(), 2);
}

TEST(TypedValue, Comparison) {
  auto v_int = TypedValue(2);
  auto v_double = TypedValue(1.5);
  EXPECT_PROP_TRUE(v_int > v_double);
  EXPECT_PROP_TRUE(v_double < v_int);
  EXPECT_PROP_TRUE(v_int >= TypedValue(2.0));
  EXPECT_PROP_FALSE(v_int <= v_double);

  EXPECT_PROP_TRUE(TypedValue("abc") < TypedValue("abd"));
  EXPECT_PROP_FALSE(TypedValue("b") < TypedValue("abc"));

  EXPECT_THROW(TypedValue("1") < TypedValue(2), TypedValueException);
  EXPECT_THROW(TypedValue() < TypedValue(2), TypedValueException);
}

TEST(TypedValue, BoolEquals) {
  auto eq = TypedValue::BoolEqual{};
  EXPECT_TRUE(eq(TypedValue(1), TypedValue(1)));
  EXPECT_FALSE(eq(TypedValue(1), TypedValue(2)));
  EXPECT_FALSE(eq(TypedValue(1), TypedValue("asd")));
  EXPECT_TRUE(eq(TypedValue(), TypedValue()));
  EXPECT_FALSE(eq(TypedValue(), TypedValue(0)));
}

TEST(TypedValue, LogicalNot) {
  EXPECT_PROP_EQ(!TypedValue(true), TypedValue(false));
  EXPECT_PROP_EQ(!TypedValue(), TypedValue(true));
  EXPECT_PROP_EQ(!TypedValue(0), TypedValue(true));
  EXPECT_PROP_EQ(!TypedValue(""), TypedValue(true));
  EXPECT_PROP_EQ(!TypedValue("x"), TypedValue(false));
  EXPECT_PROP_EQ(!TypedValue(TypedValue::TList{}), TypedValue(false));
}

TEST(TypedValue, UnaryMinus) {
  EXPECT_THROW(-TypedValue(), TypedValueException);
  EXPECT_EQ((-TypedValue(2)).ValueInt(), -2);
  EXPECT_FLOAT_EQ((-TypedValue(2.0)).ValueDouble(), -2.0);
  EXPECT_THROW(-TypedValue("something"), TypedValueException);
}

TEST(TypedValue, UnaryPlus) {
  EXPECT_EQ((+TypedValue(5)).ValueInt(), 5);
  EXPECT_FLOAT_EQ((+TypedValue(5.5)).ValueDouble(), 5.5);
  EXPECT_THROW(+TypedValue("10"), TypedValueException);
}

TEST(TypedValue, Sum) {
  EXPECT_EQ((TypedValue(2) + TypedValue(3)).ValueInt(), 5);
  EXPECT_FLOAT_EQ((TypedValue(2) + TypedValue(0.5)).ValueDouble(), 2.5);
  EXPECT_EQ((TypedValue("a") + TypedValue(1)).ValueString(), "a1");
  EXPECT_EQ((TypedValue(1.5) + TypedValue("x")).ValueString(), "1.5x");
  EXPECT_THROW(TypedValue() + TypedValue(1), TypedValueException);
  EXPECT_THROW(TypedValue(true) + TypedValue(1), TypedValueException);
}

TEST(TypedValue, Arithmetic) {
  EXPECT_EQ((TypedValue(5) - TypedValue(7)).ValueInt(), -2);
  EXPECT_EQ((TypedValue(6) * TypedValue(7)).ValueInt(), 42);
  EXPECT_EQ((TypedValue(8) / TypedValue(2)).ValueInt(), 4);
  EXPECT_FLOAT_EQ((TypedValue(7) / TypedValue(2)).ValueDouble(), 3.5);
  EXPECT_TRUE(std::isinf((TypedValue(1) / TypedValue(0)).ValueDouble()));
  EXPECT_EQ((TypedValue(7) % TypedValue(3)).ValueInt(), 1);
  EXPECT_FLOAT_EQ((TypedValue(7.5) % TypedValue(2)).ValueDouble(), 1.5);
  EXPECT_THROW(TypedValue(7) % TypedValue(0), TypedValueException);
  EXPECT_THROW(TypedValue("7") * TypedValue(2), TypedValueException);
}

TEST(TypedValue, Concat) {
  EXPECT_EQ(Concat(TypedValue(1), TypedValue(2)).ValueString(), "12");
  EXPECT_EQ(Concat(TypedValue(), TypedValue(true)).ValueString(), "true");
}

TEST(TypedValue, ToText) {
  EXPECT_EQ(TypedValue().ToText(), "");
  EXPECT_EQ(TypedValue(false).ToText(), "false");
  EXPECT_EQ(TypedValue(-12).ToText(), "-12");
  EXPECT_EQ(TypedValue(2.0).ToText(), "2");
  EXPECT_EQ(TypedValue(0.1).ToText(), "0.1");
  EXPECT_EQ(TypedValue(std::nan("")).ToText(), "NaN");
  EXPECT_EQ(TypedValue("<b>").ToText(), "<b>");
  TypedValue::TMap map;
  map.emplace("z", TypedValue(1));
  map.emplace("a", TypedValue(TypedValue::TList{TypedValue("x"), TypedValue()}));
  EXPECT_EQ(TypedValue(std::move(map)).ToText(), R"({"z":1,"a":["x",null]})");

  auto element = std::make_unique<trellis::dom::Element>("p");
  element->AppendChild(std::make_unique<trellis::dom::Text>("hi"));
  EXPECT_EQ(TypedValue::OwnNode(std::move(element)).ToText(), "<p>hi</p>");
}

TEST(TypedValue, Truthiness) {
  EXPECT_FALSE(TypedValue().ToBool());
  EXPECT_FALSE(TypedValue(0.0).ToBool());
  EXPECT_FALSE(TypedValue(std::nan("")).ToBool());
  EXPECT_TRUE(TypedValue(-1).ToBool());
  EXPECT_TRUE(TypedValue("0").ToBool());
  EXPECT_TRUE(TypedValue(TypedValue::TMap{}).ToBool());
}

TEST(TypedValue, Json) {
  auto json = nlohmann::ordered_json::parse(R"({"b":[1,2.5,"s",true,null],"a":{"n":18446744073709551615}})");
  auto value = TypedValue::FromJson(json);
  ASSERT_TRUE(value.IsMap());
  auto items = value.Items();
  ASSERT_EQ(items.size(), 2);
  EXPECT_EQ(items[0].first.ValueString(), "b");
  const auto &list = items[0].second.ValueList();
  ASSERT_EQ(list.size(), 5);
  EXPECT_EQ(list[0].ValueInt(), 1);
  EXPECT_FLOAT_EQ(list[1].ValueDouble(), 2.5);
  EXPECT_TRUE(list[4].IsNull());
  EXPECT_TRUE(value.GetMember("a").GetMember("n").IsDouble());
  EXPECT_EQ(TypedValue::FromJson(json.at("b")).ToJson(), json.at("b"));
}

TEST(TypedValue, ScriptJson) {
  TypedValue value(TypedValue::TMap{{"html", TypedValue("</script><b>")}});
  EXPECT_EQ(value.ToScriptJson(), R"({"html":"<\/script><b>"})");
  EXPECT_EQ(TypedValue("x").ToScriptJson(), "\"x\"");
  EXPECT_EQ(TypedValue().ToScriptJson(), "null");
}

TEST(TypedValue, Items) {
  TypedValue list(TypedValue::TList{TypedValue("a"), TypedValue("b")});
  auto items = list.Items();
  ASSERT_EQ(items.size(), 2);
  EXPECT_EQ(items[1].first.ValueInt(), 1);
  EXPECT_EQ(items[1].second.ValueString(), "b");
  EXPECT_TRUE(TypedValue().Items().empty());
  EXPECT_THROW(TypedValue("abc").Items(), TypedValueException);
}

TEST(TypedValue, Members) {
  TypedValue map(TypedValue::TMap{{"a", TypedValue(1)}});
  EXPECT_EQ(map.GetMember("a").ValueInt(), 1);
  EXPECT_PROP_ISNULL(map.GetMember("missing"));
  EXPECT_EQ(TypedValue("abc").GetMember("length").ValueInt(), 3);
  EXPECT_EQ(TypedValue(TypedValue::TList{TypedValue()}).GetMember("length").ValueInt(), 1);
  EXPECT_PROP_ISNULL(TypedValue(5).GetMember("x"));
  EXPECT_THROW(TypedValue().GetMember("x"), TypedValueException);
  TypedValue number(5);
  EXPECT_THROW(number.SetMember("x", TypedValue(1)), TypedValueException);
}

TEST(TypedValue, Indexing) {
  TypedValue list(TypedValue::TList{TypedValue("a"), TypedValue("b")});
  EXPECT_EQ(list.GetIndex(TypedValue(1)).ValueString(), "b");
  EXPECT_EQ(list.GetIndex(TypedValue(1.0)).ValueString(), "b");
  EXPECT_PROP_ISNULL(list.GetIndex(TypedValue(2)));
  EXPECT_PROP_ISNULL(list.GetIndex(TypedValue(-1)));
  EXPECT_EQ(list.GetIndex(TypedValue("length")).ValueInt(), 2);
  EXPECT_EQ(TypedValue("abc").GetIndex(TypedValue(2)).ValueString(), "c");

  list.SetIndex(TypedValue(3), TypedValue("d"));
  ASSERT_EQ(list.ValueList().size(), 4);
  EXPECT_PROP_ISNULL(list.GetIndex(TypedValue(2)));
  EXPECT_THROW(list.SetIndex(TypedValue(-1), TypedValue()), TypedValueException);

  TypedValue map(TypedValue::TMap{});
  map.SetIndex(TypedValue(1), TypedValue("one"));
  EXPECT_EQ(map.GetIndex(TypedValue("1")).ValueString(), "one");
}

TEST(TypedValue, Call) {
  TypedValue add(TypedValue::TFunction([](const TypedValue &self, std::vector<TypedValue> args) {
    return self.IsNull() ? args.at(0) + args.at(1) : self;
  }));
  EXPECT_EQ(add.Call(TypedValue(), {TypedValue(1), TypedValue(2)}).ValueInt(), 3);
  EXPECT_EQ(add.Call(TypedValue("me"), {}).ValueString(), "me");
  EXPECT_THROW(TypedValue(1).Call(TypedValue(), {}), TypedValueException);
}

TEST(TypedValue, Nodes) {
  trellis::dom::Element element("div", {{"class", "a"}});
  element.AppendChild(std::make_unique<trellis::dom::Text>("text"));
  auto value = TypedValue::BorrowNode(&element);

  EXPECT_EQ(value.GetMember("tagName").ValueString(), "div");
  EXPECT_EQ(value.GetMember("innerText").ValueString(), "text");
  EXPECT_EQ(value.GetMember("outerHTML").ValueString(), "<div class=\"a\">text</div>");

  value.GetMember("addClass").Call(value, {TypedValue("b")});
  value.GetMember("setAttribute").Call(value, {TypedValue("id"), TypedValue("x")});
  EXPECT_EQ(element.GetAttribute("class"), "a b");
  EXPECT_EQ(value.GetMember("getAttribute").Call(value, {TypedValue("id")}).ValueString(), "x");
  EXPECT_PROP_ISNULL(value.GetMember("getAttribute").Call(value, {TypedValue("missing")}));

  value.SetMember("innerText", TypedValue("<new>"));
  EXPECT_EQ(element.InnerHtml(), "&lt;new&gt;");

  // Script properties are shared between copies of the value.
  auto copy = value;
  copy.SetMember("custom", TypedValue(1));
  EXPECT_EQ(value.GetMember("custom").ValueInt(), 1);
  EXPECT_PROP_EQ(value, TypedValue::BorrowNode(&element));
}

TEST(TypedValue, DestroyedNodes) {
  auto element = std::make_unique<trellis::dom::Element>("div");
  auto value = TypedValue::BorrowNode(element.get());
  auto add_class = value.GetMember("addClass");
  auto map = TypedValue(TypedValue::TMap{});
  map.SetMember("el", value);
  EXPECT_EQ(map.GetMember("el").ToText(), "<div></div>");

  element.reset();
  EXPECT_THROW(map.GetMember("el").ToText(), TypedValueException);
  EXPECT_THROW(value.ToJson(), TypedValueException);
  EXPECT_THROW(value.GetMember("tagName"), TypedValueException);
  EXPECT_THROW(value.GetMember("outerHTML"), TypedValueException);
  EXPECT_THROW(add_class.Call(value, {TypedValue("x")}), TypedValueException);
  // Identity still works without touching the node.
  EXPECT_PROP_EQ(map.GetMember("el"), value);

  // An owned node lives as long as any copy of the value.
  auto owned = TypedValue::OwnNode(std::make_unique<trellis::dom::Element>("p"));
  auto owned_copy = owned;
  owned = TypedValue();
  EXPECT_EQ(owned_copy.ToText(), "<p></p>");
}
