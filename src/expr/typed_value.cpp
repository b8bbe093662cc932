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

#include "expr/typed_value.hpp"

#include <cmath>
#include <limits>
#include <memory>
#include <optional>
#include <ostream>

#include "dom/node.hpp"
#include "utils/logging.hpp"
#include "utils/string.hpp"

namespace trellis::expr {

namespace {

std::string FormatDouble(double value) {
  if (std::isnan(value)) return "NaN";
  if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
  // Whole numbers print like integers, everything else in the shortest form
  // that reads back to the same double.
  if (value == std::trunc(value) && std::abs(value) < 1e15) {
    return fmt::format("{}", static_cast<int64_t>(value));
  }
  return fmt::format("{}", value);
}

dom::Element &RequireElement(const TypedValue::NodeValue &node, std::string_view method) {
  auto &resolved = node.Resolve();
  auto *element = dom::As<dom::Element>(&resolved);
  if (!element) {
    throw TypedValueException("{} is only available on elements, not on {} nodes", method, resolved.type());
  }
  return *element;
}

TypedValue ArgumentOrNull(const std::vector<TypedValue> &args, size_t index) {
  return index < args.size() ? args[index] : TypedValue();
}

// Methods scripts can call on a node. They act on the node they were looked
// up on, so `var f = this.addClass; f("x")` still works.
std::optional<TypedValue> NodeMethod(const TypedValue::NodeValue &node, std::string_view name) {
  if (name == "getAttribute") {
    return TypedValue(TypedValue::TFunction([node](const TypedValue &, std::vector<TypedValue> args) {
      auto value = RequireElement(node, "getAttribute").FindAttribute(ArgumentOrNull(args, 0).ToText());
      return value ? TypedValue(std::move(*value)) : TypedValue();
    }));
  }
  if (name == "hasAttribute") {
    return TypedValue(TypedValue::TFunction([node](const TypedValue &, std::vector<TypedValue> args) {
      return TypedValue(RequireElement(node, "hasAttribute").HasAttribute(ArgumentOrNull(args, 0).ToText()));
    }));
  }
  if (name == "setAttribute") {
    return TypedValue(TypedValue::TFunction([node](const TypedValue &, std::vector<TypedValue> args) {
      RequireElement(node, "setAttribute")
          .SetAttribute(ArgumentOrNull(args, 0).ToText(), ArgumentOrNull(args, 1).ToText());
      return TypedValue();
    }));
  }
  if (name == "removeAttribute") {
    return TypedValue(TypedValue::TFunction([node](const TypedValue &, std::vector<TypedValue> args) {
      RequireElement(node, "removeAttribute").RemoveAttribute(ArgumentOrNull(args, 0).ToText());
      return TypedValue();
    }));
  }
  if (name == "addClass") {
    return TypedValue(TypedValue::TFunction([node](const TypedValue &, std::vector<TypedValue> args) {
      RequireElement(node, "addClass").AddClass(ArgumentOrNull(args, 0).ToText());
      return TypedValue();
    }));
  }
  return std::nullopt;
}

std::optional<int64_t> ToListIndex(const TypedValue &index) {
  if (index.IsInt()) return index.ValueInt();
  if (index.IsDouble() && index.ValueDouble() == std::trunc(index.ValueDouble())) {
    return static_cast<int64_t>(index.ValueDouble());
  }
  return std::nullopt;
}

}  // namespace

bool TypedValue::BoolEqual::operator()(const TypedValue &lhs, const TypedValue &rhs) const {
  return (lhs == rhs).ValueBool();
}

TypedValue::TypedValue(TList value) : type_(Type::List) {
  new (&list_v) std::shared_ptr<TList>(std::make_shared<TList>(std::move(value)));
}

TypedValue::TypedValue(TMap value) : type_(Type::Map) {
  new (&map_v) std::shared_ptr<TMap>(std::make_shared<TMap>(std::move(value)));
}

TypedValue::TypedValue(TFunction value) : type_(Type::Function) {
  new (&function_v) std::shared_ptr<TFunction>(std::make_shared<TFunction>(std::move(value)));
}

TypedValue::TypedValue(NodeValue value) : type_(Type::Node) {
  TR_ASSERT(value.node, "Node value without a node");
  if (!value.properties) value.properties = std::make_shared<TMap>();
  new (&node_v) NodeValue(std::move(value));
}

TypedValue TypedValue::BorrowNode(dom::Node *node) {
  return TypedValue(NodeValue{.node = node, .alive = node->liveness()});
}

TypedValue TypedValue::OwnNode(std::unique_ptr<dom::Node> node) {
  std::shared_ptr<dom::Node> owner(std::move(node));
  auto *raw = owner.get();
  return TypedValue(NodeValue{.node = raw, .owner = std::move(owner), .alive = raw->liveness()});
}

dom::Node &TypedValue::NodeValue::Resolve() const {
  if (alive.expired()) throw TypedValueException("The node this value refers to no longer exists");
  return *node;
}

TypedValue::TypedValue(const TypedValue &other) : type_(other.type_) {
  switch (other.type_) {
    case Type::Null:
      return;
    case Type::Bool:
      bool_v = other.bool_v;
      return;
    case Type::Int:
      int_v = other.int_v;
      return;
    case Type::Double:
      double_v = other.double_v;
      return;
    case Type::String:
      new (&string_v) std::string(other.string_v);
      return;
    case Type::List:
      new (&list_v) std::shared_ptr<TList>(other.list_v);
      return;
    case Type::Map:
      new (&map_v) std::shared_ptr<TMap>(other.map_v);
      return;
    case Type::Function:
      new (&function_v) std::shared_ptr<TFunction>(other.function_v);
      return;
    case Type::Node:
      new (&node_v) NodeValue(other.node_v);
      return;
  }
  LOG_FATAL("Unsupported TypedValue::Type");
}

TypedValue::TypedValue(TypedValue &&other) noexcept : type_(other.type_) {
  switch (other.type_) {
    case Type::Null:
      break;
    case Type::Bool:
      bool_v = other.bool_v;
      break;
    case Type::Int:
      int_v = other.int_v;
      break;
    case Type::Double:
      double_v = other.double_v;
      break;
    case Type::String:
      new (&string_v) std::string(std::move(other.string_v));
      break;
    case Type::List:
      new (&list_v) std::shared_ptr<TList>(std::move(other.list_v));
      break;
    case Type::Map:
      new (&map_v) std::shared_ptr<TMap>(std::move(other.map_v));
      break;
    case Type::Function:
      new (&function_v) std::shared_ptr<TFunction>(std::move(other.function_v));
      break;
    case Type::Node:
      new (&node_v) NodeValue(std::move(other.node_v));
      break;
  }
  other.DestroyValue();
}

TypedValue &TypedValue::operator=(const TypedValue &other) {
  if (this == &other) return *this;
  TypedValue copy(other);
  return *this = std::move(copy);
}

TypedValue &TypedValue::operator=(TypedValue &&other) noexcept {
  if (this == &other) return *this;
  // `other` may live inside a list or map owned by this value.
  TypedValue moved(std::move(other));
  DestroyValue();
  new (this) TypedValue(std::move(moved));
  return *this;
}

TypedValue::~TypedValue() { DestroyValue(); }

void TypedValue::DestroyValue() {
  switch (type_) {
    case Type::Null:
    case Type::Bool:
    case Type::Int:
    case Type::Double:
      break;
    case Type::String:
      std::destroy_at(&string_v);
      break;
    case Type::List:
      std::destroy_at(&list_v);
      break;
    case Type::Map:
      std::destroy_at(&map_v);
      break;
    case Type::Function:
      std::destroy_at(&function_v);
      break;
    case Type::Node:
      std::destroy_at(&node_v);
      break;
  }
  type_ = Type::Null;
}

#define DEFINE_VALUE_AND_TYPE_GETTERS(type_param, type_enum, field)                              \
  type_param &TypedValue::Value##type_enum() {                                                   \
    if (type_ != Type::type_enum) [[unlikely]]                                                   \
      throw TypedValueException("TypedValue is of type '{}', not '{}'", type_, Type::type_enum); \
    return field;                                                                                \
  }                                                                                              \
  const type_param &TypedValue::Value##type_enum() const {                                       \
    if (type_ != Type::type_enum) [[unlikely]]                                                   \
      throw TypedValueException("TypedValue is of type '{}', not '{}'", type_, Type::type_enum); \
    return field;                                                                                \
  }                                                                                              \
  bool TypedValue::Is##type_enum() const { return type_ == Type::type_enum; }

DEFINE_VALUE_AND_TYPE_GETTERS(bool, Bool, bool_v)
DEFINE_VALUE_AND_TYPE_GETTERS(int64_t, Int, int_v)
DEFINE_VALUE_AND_TYPE_GETTERS(double, Double, double_v)
DEFINE_VALUE_AND_TYPE_GETTERS(std::string, String, string_v)
DEFINE_VALUE_AND_TYPE_GETTERS(TypedValue::TList, List, *list_v)
DEFINE_VALUE_AND_TYPE_GETTERS(TypedValue::TMap, Map, *map_v)
DEFINE_VALUE_AND_TYPE_GETTERS(TypedValue::TFunction, Function, *function_v)
DEFINE_VALUE_AND_TYPE_GETTERS(TypedValue::NodeValue, Node, node_v)

#undef DEFINE_VALUE_AND_TYPE_GETTERS

double TypedValue::ToDouble() const {
  switch (type_) {
    case Type::Int:
      return static_cast<double>(int_v);
    case Type::Double:
      return double_v;
    default:
      throw TypedValueException("Expected a number, got a value of type '{}'", type_);
  }
}

std::string TypedValue::ToText() const {
  switch (type_) {
    case Type::Null:
      return "";
    case Type::Bool:
      return bool_v ? "true" : "false";
    case Type::Int:
      return std::to_string(int_v);
    case Type::Double:
      return FormatDouble(double_v);
    case Type::String:
      return string_v;
    case Type::List:
    case Type::Map:
      return ToJson().dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    case Type::Function:
      return "[function]";
    case Type::Node:
      return node_v.Resolve().ToHtml();
  }
  LOG_FATAL("Unsupported TypedValue::Type");
}

bool TypedValue::ToBool() const {
  switch (type_) {
    case Type::Null:
      return false;
    case Type::Bool:
      return bool_v;
    case Type::Int:
      return int_v != 0;
    case Type::Double:
      return double_v != 0.0 && !std::isnan(double_v);
    case Type::String:
      return !string_v.empty();
    case Type::List:
    case Type::Map:
    case Type::Function:
    case Type::Node:
      return true;
  }
  LOG_FATAL("Unsupported TypedValue::Type");
}

nlohmann::ordered_json TypedValue::ToJson() const {
  switch (type_) {
    case Type::Null:
    case Type::Function:
      return nullptr;
    case Type::Bool:
      return bool_v;
    case Type::Int:
      return int_v;
    case Type::Double:
      if (!std::isfinite(double_v)) return nullptr;
      return double_v;
    case Type::String:
      return string_v;
    case Type::List: {
      auto array = nlohmann::ordered_json::array();
      for (const auto &item : *list_v) array.push_back(item.ToJson());
      return array;
    }
    case Type::Map: {
      auto object = nlohmann::ordered_json::object();
      for (const auto &[key, item] : *map_v) object[key] = item.ToJson();
      return object;
    }
    case Type::Node:
      return node_v.Resolve().ToHtml();
  }
  LOG_FATAL("Unsupported TypedValue::Type");
}

TypedValue TypedValue::FromJson(const nlohmann::ordered_json &json) {
  switch (json.type()) {
    case nlohmann::ordered_json::value_t::null:
      return {};
    case nlohmann::ordered_json::value_t::boolean:
      return TypedValue(json.get<bool>());
    case nlohmann::ordered_json::value_t::number_integer:
      return TypedValue(json.get<int64_t>());
    case nlohmann::ordered_json::value_t::number_unsigned: {
      auto value = json.get<uint64_t>();
      if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return TypedValue(static_cast<double>(value));
      }
      return TypedValue(static_cast<int64_t>(value));
    }
    case nlohmann::ordered_json::value_t::number_float:
      return TypedValue(json.get<double>());
    case nlohmann::ordered_json::value_t::string:
      return TypedValue(json.get<std::string>());
    case nlohmann::ordered_json::value_t::array: {
      TList list;
      list.reserve(json.size());
      for (const auto &item : json) list.push_back(FromJson(item));
      return TypedValue(std::move(list));
    }
    case nlohmann::ordered_json::value_t::object: {
      TMap map;
      for (const auto &[key, item] : json.items()) map.emplace(key, FromJson(item));
      return TypedValue(std::move(map));
    }
    case nlohmann::ordered_json::value_t::binary:
    case nlohmann::ordered_json::value_t::discarded:
      break;
  }
  throw TypedValueException("Unsupported JSON value of type '{}'", json.type_name());
}

std::string TypedValue::ToScriptJson() const {
  auto json = ToJson().dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
  return utils::Replace(json, "</", "<\\/");
}

std::vector<std::pair<TypedValue, TypedValue>> TypedValue::Items() const {
  std::vector<std::pair<TypedValue, TypedValue>> items;
  switch (type_) {
    case Type::Null:
      break;
    case Type::List:
      items.reserve(list_v->size());
      for (size_t i = 0; i < list_v->size(); ++i) {
        items.emplace_back(TypedValue(static_cast<int64_t>(i)), (*list_v)[i]);
      }
      break;
    case Type::Map:
      items.reserve(map_v->size());
      for (const auto &[key, item] : *map_v) items.emplace_back(TypedValue(key), item);
      break;
    default:
      throw TypedValueException("Cannot iterate over a value of type '{}'", type_);
  }
  return items;
}

TypedValue TypedValue::GetMember(std::string_view name) const {
  switch (type_) {
    case Type::Null:
      throw TypedValueException("Cannot read property '{}' of null", name);
    case Type::Map: {
      auto it = map_v->find(std::string(name));
      return it == map_v->end() ? TypedValue() : it->second;
    }
    case Type::List:
      if (name == "length") return TypedValue(static_cast<int64_t>(list_v->size()));
      return {};
    case Type::String:
      if (name == "length") return TypedValue(static_cast<int64_t>(string_v.size()));
      return {};
    case Type::Node: {
      auto it = node_v.properties->find(std::string(name));
      if (it != node_v.properties->end()) return it->second;
      if (name == "tagName") {
        const auto *element = dom::As<dom::Element>(&node_v.Resolve());
        return element ? TypedValue(element->tag_name()) : TypedValue();
      }
      if (name == "innerText") return TypedValue(node_v.Resolve().TextContent());
      if (name == "innerHTML") return TypedValue(node_v.Resolve().InnerHtml());
      if (name == "outerHTML") return TypedValue(node_v.Resolve().ToHtml());
      return NodeMethod(node_v, name).value_or(TypedValue());
    }
    case Type::Bool:
    case Type::Int:
    case Type::Double:
    case Type::Function:
      return {};
  }
  LOG_FATAL("Unsupported TypedValue::Type");
}

void TypedValue::SetMember(std::string_view name, TypedValue value) {
  switch (type_) {
    case Type::Map:
      (*map_v)[std::string(name)] = std::move(value);
      return;
    case Type::Node:
      if (name == "innerText") {
        RequireElement(node_v, "innerText").SetInnerText(value.ToText());
        return;
      }
      (*node_v.properties)[std::string(name)] = std::move(value);
      return;
    default:
      throw TypedValueException("Cannot set property '{}' on a value of type '{}'", name, type_);
  }
}

TypedValue TypedValue::GetIndex(const TypedValue &index) const {
  switch (type_) {
    case Type::List: {
      auto position = ToListIndex(index);
      if (!position) return GetMember(index.ToText());
      if (*position < 0 || static_cast<size_t>(*position) >= list_v->size()) return {};
      return (*list_v)[static_cast<size_t>(*position)];
    }
    case Type::String: {
      auto position = ToListIndex(index);
      if (!position) return GetMember(index.ToText());
      if (*position < 0 || static_cast<size_t>(*position) >= string_v.size()) return {};
      return TypedValue(std::string(1, string_v[static_cast<size_t>(*position)]));
    }
    default:
      return GetMember(index.ToText());
  }
}

void TypedValue::SetIndex(const TypedValue &index, TypedValue value) {
  if (type_ != Type::List) {
    SetMember(index.ToText(), std::move(value));
    return;
  }
  auto position = ToListIndex(index);
  if (!position || *position < 0) {
    throw TypedValueException("List index must be a non-negative number, got '{}'", index.ToText());
  }
  auto slot = static_cast<size_t>(*position);
  if (slot >= list_v->size()) list_v->resize(slot + 1);
  (*list_v)[slot] = std::move(value);
}

TypedValue TypedValue::Call(const TypedValue &self, std::vector<TypedValue> args) const {
  if (type_ != Type::Function) throw TypedValueException("A value of type '{}' is not callable", type_);
  // Keep the callable alive even if the call overwrites the binding it came from.
  auto function = function_v;
  return (*function)(self, std::move(args));
}

TypedValue operator!(const TypedValue &a) { return TypedValue(!a.ToBool()); }

TypedValue operator-(const TypedValue &a) {
  if (a.IsInt()) return TypedValue(-a.ValueInt());
  if (a.IsDouble()) return TypedValue(-a.ValueDouble());
  throw TypedValueException("Invalid type for unary minus: '{}'", a.type());
}

TypedValue operator+(const TypedValue &a) {
  if (a.IsNumeric()) return a;
  throw TypedValueException("Invalid type for unary plus: '{}'", a.type());
}

TypedValue operator==(const TypedValue &a, const TypedValue &b) {
  if (a.IsNumeric() && b.IsNumeric()) {
    if (a.IsInt() && b.IsInt()) return TypedValue(a.ValueInt() == b.ValueInt());
    return TypedValue(a.ToDouble() == b.ToDouble());
  }
  if (a.type() != b.type()) return TypedValue(false);
  switch (a.type()) {
    case TypedValue::Type::Null:
      return TypedValue(true);
    case TypedValue::Type::Bool:
      return TypedValue(a.ValueBool() == b.ValueBool());
    case TypedValue::Type::String:
      return TypedValue(a.ValueString() == b.ValueString());
    case TypedValue::Type::List:
      return TypedValue(&a.ValueList() == &b.ValueList());
    case TypedValue::Type::Map:
      return TypedValue(&a.ValueMap() == &b.ValueMap());
    case TypedValue::Type::Function:
      return TypedValue(&a.ValueFunction() == &b.ValueFunction());
    case TypedValue::Type::Node:
      return TypedValue(a.ValueNode().node == b.ValueNode().node);
    case TypedValue::Type::Int:
    case TypedValue::Type::Double:
      break;
  }
  LOG_FATAL("Unhandled comparison for types");
}

TypedValue operator<(const TypedValue &a, const TypedValue &b) {
  if (a.IsNumeric() && b.IsNumeric()) {
    if (a.IsInt() && b.IsInt()) return TypedValue(a.ValueInt() < b.ValueInt());
    return TypedValue(a.ToDouble() < b.ToDouble());
  }
  if (a.IsString() && b.IsString()) return TypedValue(a.ValueString() < b.ValueString());
  throw TypedValueException("Invalid 'less' operand types: {} < {}", a.type(), b.type());
}

TypedValue operator+(const TypedValue &a, const TypedValue &b) {
  if (a.IsString() || b.IsString()) return Concat(a, b);
  if (a.IsInt() && b.IsInt()) return TypedValue(a.ValueInt() + b.ValueInt());
  if (a.IsNumeric() && b.IsNumeric()) return TypedValue(a.ToDouble() + b.ToDouble());
  throw TypedValueException("Invalid 'plus' operand types: {} + {}", a.type(), b.type());
}

TypedValue operator-(const TypedValue &a, const TypedValue &b) {
  if (a.IsInt() && b.IsInt()) return TypedValue(a.ValueInt() - b.ValueInt());
  if (a.IsNumeric() && b.IsNumeric()) return TypedValue(a.ToDouble() - b.ToDouble());
  throw TypedValueException("Invalid 'minus' operand types: {} - {}", a.type(), b.type());
}

TypedValue operator*(const TypedValue &a, const TypedValue &b) {
  if (a.IsInt() && b.IsInt()) return TypedValue(a.ValueInt() * b.ValueInt());
  if (a.IsNumeric() && b.IsNumeric()) return TypedValue(a.ToDouble() * b.ToDouble());
  throw TypedValueException("Invalid 'multiply' operand types: {} * {}", a.type(), b.type());
}

TypedValue operator/(const TypedValue &a, const TypedValue &b) {
  if (!a.IsNumeric() || !b.IsNumeric()) {
    throw TypedValueException("Invalid 'divide' operand types: {} / {}", a.type(), b.type());
  }
  if (a.IsInt() && b.IsInt() && b.ValueInt() != 0 && a.ValueInt() % b.ValueInt() == 0) {
    return TypedValue(a.ValueInt() / b.ValueInt());
  }
  return TypedValue(a.ToDouble() / b.ToDouble());
}

TypedValue operator%(const TypedValue &a, const TypedValue &b) {
  if (a.IsInt() && b.IsInt()) {
    if (b.ValueInt() == 0) throw TypedValueException("Mod by zero");
    return TypedValue(a.ValueInt() % b.ValueInt());
  }
  if (a.IsNumeric() && b.IsNumeric()) return TypedValue(std::fmod(a.ToDouble(), b.ToDouble()));
  throw TypedValueException("Invalid 'modulo' operand types: {} % {}", a.type(), b.type());
}

TypedValue Concat(const TypedValue &a, const TypedValue &b) { return TypedValue(a.ToText() + b.ToText()); }

std::ostream &operator<<(std::ostream &os, const TypedValue::Type &type) {
  switch (type) {
    case TypedValue::Type::Null:
      return os << "null";
    case TypedValue::Type::Bool:
      return os << "bool";
    case TypedValue::Type::Int:
      return os << "int";
    case TypedValue::Type::Double:
      return os << "double";
    case TypedValue::Type::String:
      return os << "string";
    case TypedValue::Type::List:
      return os << "list";
    case TypedValue::Type::Map:
      return os << "map";
    case TypedValue::Type::Function:
      return os << "function";
    case TypedValue::Type::Node:
      return os << "node";
  }
  LOG_FATAL("Unsupported TypedValue::Type");
}

std::ostream &operator<<(std::ostream &os, const TypedValue &value) { return os << value.ToText(); }

}  // namespace trellis::expr
