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

#include <string>
#include <string_view>

#include "expr/typed_value.hpp"

namespace trellis::expr {

/**
 * Scoped name bindings used to evaluate expressions.
 *
 * Lookups resolve in the local bindings first and then walk the chain of
 * parents. Writes always go to the local bindings, so a child scope can
 * shadow a name but never modifies its parent. A child must not outlive its
 * parent.
 */
class Context {
 public:
  using Bindings = TypedValue::TMap;

  Context() = default;
  explicit Context(const Context *parent) : parent_(parent) {}

  const Context *parent() const { return parent_; }
  const Bindings &locals() const { return locals_; }

  /// Nearest binding of `name`, nullptr if it is unbound.
  const TypedValue *Find(std::string_view name) const;

  /// @throw UnboundVariableError
  const TypedValue &Get(std::string_view name) const;

  bool Contains(std::string_view name) const { return Find(name) != nullptr; }
  bool ContainsLocal(std::string_view name) const;

  void Set(std::string_view name, TypedValue value);

  /// Parentless copy holding every binding visible from this scope.
  Context Flatten() const;

 private:
  const Context *parent_{nullptr};
  Bindings locals_;
};

}  // namespace trellis::expr
