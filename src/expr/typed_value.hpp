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

#include <cstdint>
#include <functional>
#include <iosfwd>
#include <memory>
#include <new>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>
#include <nlohmann/json.hpp>

#include "utils/exceptions.hpp"

namespace trellis::dom {
class Node;
}  // namespace trellis::dom

namespace trellis::expr {

/**
 * An exception raised by the TypedValue system. Typically when
 * trying to perform operations (such as addition) on TypedValues
 * of incompatible Types.
 */
class TypedValueException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(TypedValueException)
};

/**
 * Stores a template runtime value and its type.
 *
 * Values can be of a number of predefined types that are enumerated in
 * TypedValue::Type. Lists, maps and functions are shared between copies the
 * way objects are shared in scripting languages: copying a list value and
 * appending to the copy is visible through the original. Maps keep their
 * keys in insertion order.
 */
class TypedValue {
 public:
  /** Custom TypedValue equality function that returns a bool
   * (as opposed to returning TypedValue as the default equality does).
   */
  struct BoolEqual {
    bool operator()(const TypedValue &lhs, const TypedValue &rhs) const;
  };

  /** A value type. Each type corresponds to exactly one C++ type */
  enum class Type : unsigned { Null, Bool, Int, Double, String, List, Map, Function, Node };

  using TList = std::vector<TypedValue>;
  using TMap = nlohmann::ordered_map<std::string, TypedValue>;
  /// Native callable receiving the value it was looked up on (`this`) and
  /// the call arguments.
  using TFunction = std::function<TypedValue(const TypedValue &self, std::vector<TypedValue> args)>;

  /// Reference to a markup node. The node is either borrowed from the tree
  /// being expanded or owned by the value (`owner` is set). A borrowed node
  /// can be destroyed while values still refer to it; `alive` tells. Scripts
  /// can attach their own properties, which are shared between copies.
  struct NodeValue {
    dom::Node *node{nullptr};
    std::shared_ptr<dom::Node> owner;
    std::shared_ptr<TMap> properties;
    std::weak_ptr<bool> alive;

    /// @throw TypedValueException if a borrowed node has been destroyed.
    dom::Node &Resolve() const;
  };

  /** Construct a Null value. */
  TypedValue() : type_(Type::Null) {}

  explicit TypedValue(bool value) : type_(Type::Bool) { bool_v = value; }
  explicit TypedValue(int value) : type_(Type::Int) { int_v = value; }
  explicit TypedValue(int64_t value) : type_(Type::Int) { int_v = value; }
  explicit TypedValue(double value) : type_(Type::Double) { double_v = value; }

  explicit TypedValue(const char *value) : type_(Type::String) { new (&string_v) std::string(value); }
  explicit TypedValue(std::string_view value) : type_(Type::String) { new (&string_v) std::string(value); }
  explicit TypedValue(std::string value) : type_(Type::String) { new (&string_v) std::string(std::move(value)); }

  explicit TypedValue(TList value);
  explicit TypedValue(TMap value);
  explicit TypedValue(TFunction value);
  explicit TypedValue(NodeValue value);

  /// Value borrowing `node`, which has to outlive every copy of the value.
  static TypedValue BorrowNode(dom::Node *node);
  /// Value taking ownership of a detached node.
  static TypedValue OwnNode(std::unique_ptr<dom::Node> node);

  TypedValue(const TypedValue &other);
  TypedValue(TypedValue &&other) noexcept;
  TypedValue &operator=(const TypedValue &other);
  TypedValue &operator=(TypedValue &&other) noexcept;
  ~TypedValue();

  Type type() const { return type_; }

#define DECLARE_VALUE_AND_TYPE_GETTERS(type_param, type_enum) \
  type_param &Value##type_enum();                             \
  const type_param &Value##type_enum() const;                 \
  bool Is##type_enum() const;

  DECLARE_VALUE_AND_TYPE_GETTERS(bool, Bool)
  DECLARE_VALUE_AND_TYPE_GETTERS(int64_t, Int)
  DECLARE_VALUE_AND_TYPE_GETTERS(double, Double)
  DECLARE_VALUE_AND_TYPE_GETTERS(std::string, String)
  DECLARE_VALUE_AND_TYPE_GETTERS(TList, List)
  DECLARE_VALUE_AND_TYPE_GETTERS(TMap, Map)
  DECLARE_VALUE_AND_TYPE_GETTERS(TFunction, Function)
  DECLARE_VALUE_AND_TYPE_GETTERS(NodeValue, Node)

#undef DECLARE_VALUE_AND_TYPE_GETTERS

  bool IsNull() const { return type_ == Type::Null; }
  bool IsNumeric() const { return IsInt() || IsDouble(); }

  /// Numeric value widened to double.
  /// @throw TypedValueException if the value is not numeric.
  double ToDouble() const;

  /// Text form used when the value is spliced into markup: Null is empty,
  /// numbers use their shortest form, lists and maps are JSON and nodes are
  /// their outer HTML.
  std::string ToText() const;

  /// Script truthiness.
  bool ToBool() const;

  nlohmann::ordered_json ToJson() const;
  static TypedValue FromJson(const nlohmann::ordered_json &json);

  /// JSON which can be placed inside a `<script>` element: `</` is written
  /// as `<\/` so the text cannot close the element.
  std::string ToScriptJson() const;

  /// (key, item) pairs in iteration order. Lists yield their indices, maps
  /// their keys in insertion order and Null yields nothing.
  /// @throw TypedValueException for any other type.
  std::vector<std::pair<TypedValue, TypedValue>> Items() const;

  /// Reading a missing member yields Null.
  /// @throw TypedValueException when reading a member of Null.
  TypedValue GetMember(std::string_view name) const;
  void SetMember(std::string_view name, TypedValue value);

  TypedValue GetIndex(const TypedValue &index) const;
  void SetIndex(const TypedValue &index, TypedValue value);

  /// @throw TypedValueException if the value is not a function.
  TypedValue Call(const TypedValue &self, std::vector<TypedValue> args) const;

  friend TypedValue operator!(const TypedValue &a);
  friend TypedValue operator-(const TypedValue &a);
  friend TypedValue operator+(const TypedValue &a);

  /** Strings are equal by content, numbers by value and lists, maps,
   * functions and nodes by identity. Values of different types are not
   * equal. */
  friend TypedValue operator==(const TypedValue &a, const TypedValue &b);
  friend TypedValue operator!=(const TypedValue &a, const TypedValue &b) { return !(a == b); }

  /** @throw TypedValueException unless both values are numbers or both are
   * strings. */
  friend TypedValue operator<(const TypedValue &a, const TypedValue &b);
  friend TypedValue operator<=(const TypedValue &a, const TypedValue &b) { return TypedValue(!(b < a).ValueBool()); }
  friend TypedValue operator>(const TypedValue &a, const TypedValue &b) { return b < a; }
  friend TypedValue operator>=(const TypedValue &a, const TypedValue &b) { return TypedValue(!(a < b).ValueBool()); }

  /** Concatenates when either side is a string, adds numbers otherwise. */
  friend TypedValue operator+(const TypedValue &a, const TypedValue &b);
  friend TypedValue operator-(const TypedValue &a, const TypedValue &b);
  friend TypedValue operator*(const TypedValue &a, const TypedValue &b);
  /** Integer division yields an integer only when it is exact. */
  friend TypedValue operator/(const TypedValue &a, const TypedValue &b);
  friend TypedValue operator%(const TypedValue &a, const TypedValue &b);

  /** Concatenation of the text forms. */
  friend TypedValue Concat(const TypedValue &a, const TypedValue &b);

  /** Output the TypedValue::Type value as a string */
  friend std::ostream &operator<<(std::ostream &os, const TypedValue::Type &type);

 private:
  void DestroyValue();

  // storage for the value
  union {
    bool bool_v;
    int64_t int_v;
    double double_v;
    std::string string_v;
    std::shared_ptr<TList> list_v;
    std::shared_ptr<TMap> map_v;
    std::shared_ptr<TFunction> function_v;
    NodeValue node_v;
  };

  /**
   * The Type of the value.
   */
  Type type_;
};

std::ostream &operator<<(std::ostream &os, const TypedValue &value);

}  // namespace trellis::expr

template <>
class fmt::formatter<trellis::expr::TypedValue::Type> : public fmt::ostream_formatter {};
