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

#include <string_view>

#include "utils/exceptions.hpp"

namespace trellis::expr {

/// Base of every failure raised while parsing or evaluating an expression.
class ExpressionException : public utils::BasicException {
 public:
  using utils::BasicException::BasicException;
  SPECIALIZE_GET_EXCEPTION_NAME(ExpressionException)
};

class SyntaxException : public ExpressionException {
 public:
  using ExpressionException::ExpressionException;
  SyntaxException() : ExpressionException("") {}
  SPECIALIZE_GET_EXCEPTION_NAME(SyntaxException)
};

class UnboundVariableError : public ExpressionException {
 public:
  explicit UnboundVariableError(std::string_view name) : ExpressionException("Unbound variable: {}.", name) {}
  SPECIALIZE_GET_EXCEPTION_NAME(UnboundVariableError)
};

class ExpressionRuntimeException : public ExpressionException {
 public:
  using ExpressionException::ExpressionException;
  SPECIALIZE_GET_EXCEPTION_NAME(ExpressionRuntimeException)
};

}  // namespace trellis::expr
