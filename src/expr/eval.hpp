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

#include "expr/ast.hpp"
#include "expr/context.hpp"
#include "expr/typed_value.hpp"

namespace trellis::expr {

/**
 * Evaluates an expression tree against a Context.
 *
 * Bindings created by assignments and `var` declarations always land in the
 * context the evaluator was constructed with.
 */
class ExpressionEvaluator : public ExpressionVisitor {
 public:
  explicit ExpressionEvaluator(Context *context) : context_(context) {}

  using ExpressionVisitor::Visit;

  TypedValue Visit(PrimitiveLiteral &literal) override { return literal.value_; }
  TypedValue Visit(ListLiteral &literal) override;
  TypedValue Visit(MapLiteral &literal) override;
  TypedValue Visit(Identifier &ident) override { return context_->Get(ident.name_); }
  TypedValue Visit(PropertyLookup &property_lookup) override;
  TypedValue Visit(IndexingOperator &indexing_operator) override;
  TypedValue Visit(FunctionCall &function) override;

#define UNARY_OPERATOR_VISITOR(OP_NODE, CPP_OP)                  \
  TypedValue Visit(OP_NODE &op) override {                       \
    return CPP_OP(op.expression_->Accept(*this));                \
  }

#define BINARY_OPERATOR_VISITOR(OP_NODE, CPP_OP)                 \
  TypedValue Visit(OP_NODE &op) override {                       \
    auto val1 = op.expression1_->Accept(*this);                  \
    auto val2 = op.expression2_->Accept(*this);                  \
    return val1 CPP_OP val2;                                     \
  }

  UNARY_OPERATOR_VISITOR(NotOperator, !);
  UNARY_OPERATOR_VISITOR(UnaryMinusOperator, -);
  UNARY_OPERATOR_VISITOR(UnaryPlusOperator, +);

  BINARY_OPERATOR_VISITOR(EqualOperator, ==);
  BINARY_OPERATOR_VISITOR(NotEqualOperator, !=);
  BINARY_OPERATOR_VISITOR(LessOperator, <);
  BINARY_OPERATOR_VISITOR(LessEqualOperator, <=);
  BINARY_OPERATOR_VISITOR(GreaterOperator, >);
  BINARY_OPERATOR_VISITOR(GreaterEqualOperator, >=);
  BINARY_OPERATOR_VISITOR(AdditionOperator, +);
  BINARY_OPERATOR_VISITOR(SubtractionOperator, -);
  BINARY_OPERATOR_VISITOR(MultiplicationOperator, *);
  BINARY_OPERATOR_VISITOR(DivisionOperator, /);
  BINARY_OPERATOR_VISITOR(ModOperator, %);

#undef BINARY_OPERATOR_VISITOR
#undef UNARY_OPERATOR_VISITOR

  TypedValue Visit(ConcatOperator &op) override {
    auto val1 = op.expression1_->Accept(*this);
    auto val2 = op.expression2_->Accept(*this);
    return Concat(val1, val2);
  }

  // Both logical operators evaluate the right side only when the left one
  // does not decide the result, and yield the deciding operand itself.
  TypedValue Visit(OrOperator &op) override {
    auto value1 = op.expression1_->Accept(*this);
    if (value1.ToBool()) return value1;
    return op.expression2_->Accept(*this);
  }

  TypedValue Visit(AndOperator &op) override {
    auto value1 = op.expression1_->Accept(*this);
    if (!value1.ToBool()) return value1;
    return op.expression2_->Accept(*this);
  }

  TypedValue Visit(IfOperator &if_operator) override {
    auto condition = if_operator.condition_->Accept(*this);
    return condition.ToBool() ? if_operator.then_expression_->Accept(*this)
                              : if_operator.else_expression_->Accept(*this);
  }

  TypedValue Visit(Assignment &assignment) override;
  TypedValue Visit(VariableDeclaration &declaration) override;
  TypedValue Visit(StatementList &statements) override;

 private:
  Context *context_;
};

}  // namespace trellis::expr
