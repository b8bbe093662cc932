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

#include "expr/interpret.hpp"

#include <spdlog/spdlog.h>

#include "expr/eval.hpp"
#include "expr/parser.hpp"

namespace trellis::expr {

TypedValue Interpret(std::string_view source, Context &context) {
  spdlog::trace("Evaluating expression: {}", source);
  AstStorage storage;
  auto *statements = ParseStatements(source, &storage);
  ExpressionEvaluator evaluator(&context);
  return statements->Accept(evaluator);
}

}  // namespace trellis::expr
