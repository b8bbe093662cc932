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

#include "expr/eval.hpp"

#include <vector>

#include "expr/exceptions.hpp"
#include "utils/logging.hpp"

namespace trellis::expr {

namespace {

std::string_view DescribeCallee(const Expression *callee) {
  if (const auto *ident = dynamic_cast<const Identifier *>(callee)) return ident->name_;
  if (const auto *lookup = dynamic_cast<const PropertyLookup *>(callee)) return lookup->property_;
  return "expression";
}

}  // namespace

TypedValue ExpressionEvaluator::Visit(ListLiteral &literal) {
  TypedValue::TList result;
  result.reserve(literal.elements_.size());
  for (auto *expression : literal.elements_) result.emplace_back(expression->Accept(*this));
  return TypedValue(std::move(result));
}

TypedValue ExpressionEvaluator::Visit(MapLiteral &literal) {
  TypedValue::TMap result;
  for (const auto &[key, expression] : literal.elements_) result[key] = expression->Accept(*this);
  return TypedValue(std::move(result));
}

TypedValue ExpressionEvaluator::Visit(PropertyLookup &property_lookup) {
  auto expression_result = property_lookup.expression_->Accept(*this);
  return expression_result.GetMember(property_lookup.property_);
}

TypedValue ExpressionEvaluator::Visit(IndexingOperator &indexing_operator) {
  auto lhs = indexing_operator.expression1_->Accept(*this);
  auto index = indexing_operator.expression2_->Accept(*this);
  if (lhs.IsNull()) throw ExpressionRuntimeException("Cannot read index '{}' of null", index.ToText());
  return lhs.GetIndex(index);
}

TypedValue ExpressionEvaluator::Visit(FunctionCall &function) {
  TypedValue self;
  TypedValue callee;
  if (auto *lookup = dynamic_cast<PropertyLookup *>(function.function_)) {
    self = lookup->expression_->Accept(*this);
    callee = self.GetMember(lookup->property_);
  } else {
    callee = function.function_->Accept(*this);
  }
  if (!callee.IsFunction()) {
    throw ExpressionRuntimeException("'{}' is not a function, it is a value of type '{}'",
                                     DescribeCallee(function.function_), callee.type());
  }

  std::vector<TypedValue> arguments;
  arguments.reserve(function.arguments_.size());
  for (auto *argument : function.arguments_) arguments.emplace_back(argument->Accept(*this));
  return callee.Call(self, std::move(arguments));
}

TypedValue ExpressionEvaluator::Visit(Assignment &assignment) {
  if (auto *ident = dynamic_cast<Identifier *>(assignment.target_)) {
    auto value = assignment.value_->Accept(*this);
    context_->Set(ident->name_, value);
    return value;
  }
  if (auto *lookup = dynamic_cast<PropertyLookup *>(assignment.target_)) {
    auto object = lookup->expression_->Accept(*this);
    auto value = assignment.value_->Accept(*this);
    object.SetMember(lookup->property_, value);
    return value;
  }
  if (auto *indexing = dynamic_cast<IndexingOperator *>(assignment.target_)) {
    auto object = indexing->expression1_->Accept(*this);
    auto index = indexing->expression2_->Accept(*this);
    auto value = assignment.value_->Accept(*this);
    object.SetIndex(index, value);
    return value;
  }
  LOG_FATAL("Assignment to an expression the parser should have rejected");
}

TypedValue ExpressionEvaluator::Visit(VariableDeclaration &declaration) {
  auto value = declaration.value_ ? declaration.value_->Accept(*this) : TypedValue();
  context_->Set(declaration.name_, value);
  return value;
}

TypedValue ExpressionEvaluator::Visit(StatementList &statements) {
  TypedValue last;
  for (auto *statement : statements.statements_) last = statement->Accept(*this);
  return last;
}

}  // namespace trellis::expr
