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

#include "expr/context.hpp"

#include <vector>

#include "expr/exceptions.hpp"

namespace trellis::expr {

const TypedValue *Context::Find(std::string_view name) const {
  const std::string key(name);
  for (const auto *scope = this; scope; scope = scope->parent_) {
    auto it = scope->locals_.find(key);
    if (it != scope->locals_.end()) return &it->second;
  }
  return nullptr;
}

const TypedValue &Context::Get(std::string_view name) const {
  const auto *value = Find(name);
  if (!value) throw UnboundVariableError(name);
  return *value;
}

bool Context::ContainsLocal(std::string_view name) const { return locals_.find(std::string(name)) != locals_.end(); }

void Context::Set(std::string_view name, TypedValue value) { locals_[std::string(name)] = std::move(value); }

Context Context::Flatten() const {
  std::vector<const Context *> chain;
  for (const auto *scope = this; scope; scope = scope->parent_) chain.push_back(scope);

  Context flat;
  // Outermost first so inner bindings win.
  for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
    for (const auto &[name, value] : (*it)->locals_) flat.locals_[name] = value;
  }
  return flat;
}

}  // namespace trellis::expr
