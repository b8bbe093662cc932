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

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "expr/typed_value.hpp"
#include "utils/visitor.hpp"

namespace trellis::expr {

class PrimitiveLiteral;
class ListLiteral;
class MapLiteral;
class Identifier;
class PropertyLookup;
class IndexingOperator;
class FunctionCall;
class NotOperator;
class UnaryMinusOperator;
class UnaryPlusOperator;
class OrOperator;
class AndOperator;
class EqualOperator;
class NotEqualOperator;
class LessOperator;
class LessEqualOperator;
class GreaterOperator;
class GreaterEqualOperator;
class AdditionOperator;
class SubtractionOperator;
class ConcatOperator;
class MultiplicationOperator;
class DivisionOperator;
class ModOperator;
class IfOperator;
class Assignment;
class VariableDeclaration;
class StatementList;

using ExpressionVisitor =
    utils::Visitor<TypedValue, PrimitiveLiteral, ListLiteral, MapLiteral, Identifier, PropertyLookup, IndexingOperator,
                   FunctionCall, NotOperator, UnaryMinusOperator, UnaryPlusOperator, OrOperator, AndOperator,
                   EqualOperator, NotEqualOperator, LessOperator, LessEqualOperator, GreaterOperator,
                   GreaterEqualOperator, AdditionOperator, SubtractionOperator, ConcatOperator, MultiplicationOperator,
                   DivisionOperator, ModOperator, IfOperator, Assignment, VariableDeclaration, StatementList>;

class Expression : public utils::Visitable<ExpressionVisitor> {
 public:
  Expression() = default;
  Expression(const Expression &) = delete;
  Expression &operator=(const Expression &) = delete;
  ~Expression() override = default;
};

/// Owns every node of the expressions parsed into it.
class AstStorage {
 public:
  AstStorage() = default;
  AstStorage(const AstStorage &) = delete;
  AstStorage &operator=(const AstStorage &) = delete;
  AstStorage(AstStorage &&) = default;
  AstStorage &operator=(AstStorage &&) = default;
  ~AstStorage() = default;

  template <typename T, typename... Args>
  T *Create(Args &&...args) {
    auto ptr = std::make_unique<T>(std::forward<Args>(args)...);
    auto *raw = ptr.get();
    storage_.emplace_back(std::move(ptr));
    return raw;
  }

 private:
  std::vector<std::unique_ptr<Expression>> storage_;
};

class PrimitiveLiteral : public Expression {
 public:
  DEFVISITABLE(ExpressionVisitor)

  PrimitiveLiteral() = default;
  template <typename T>
  explicit PrimitiveLiteral(T value) : value_(value) {}

  TypedValue value_;
};

class ListLiteral : public Expression {
 public:
  DEFVISITABLE(ExpressionVisitor)

  ListLiteral() = default;
  explicit ListLiteral(std::vector<Expression *> elements) : elements_(std::move(elements)) {}

  std::vector<Expression *> elements_;
};

class MapLiteral : public Expression {
 public:
  DEFVISITABLE(ExpressionVisitor)

  MapLiteral() = default;
  explicit MapLiteral(std::vector<std::pair<std::string, Expression *>> elements) : elements_(std::move(elements)) {}

  std::vector<std::pair<std::string, Expression *>> elements_;
};

class Identifier : public Expression {
 public:
  DEFVISITABLE(ExpressionVisitor)

  explicit Identifier(std::string name) : name_(std::move(name)) {}

  std::string name_;
};

/// `expression.property`
class PropertyLookup : public Expression {
 public:
  DEFVISITABLE(ExpressionVisitor)

  PropertyLookup(Expression *expression, std::string property) : expression_(expression), property_(std::move(property)) {}

  Expression *expression_{nullptr};
  std::string property_;
};

/// `expression1[expression2]`
class IndexingOperator : public Expression {
 public:
  DEFVISITABLE(ExpressionVisitor)

  IndexingOperator(Expression *expression1, Expression *expression2)
      : expression1_(expression1), expression2_(expression2) {}

  Expression *expression1_{nullptr};
  Expression *expression2_{nullptr};
};

/// Calls the value of `function_`. When it is a @c PropertyLookup the looked
/// up object becomes `this` of the call.
class FunctionCall : public Expression {
 public:
  DEFVISITABLE(ExpressionVisitor)

  FunctionCall(Expression *function, std::vector<Expression *> arguments)
      : function_(function), arguments_(std::move(arguments)) {}

  Expression *function_{nullptr};
  std::vector<Expression *> arguments_;
};

class UnaryOperator : public Expression {
 public:
  explicit UnaryOperator(Expression *expression) : expression_(expression) {}

  Expression *expression_{nullptr};
};

class BinaryOperator : public Expression {
 public:
  BinaryOperator(Expression *expression1, Expression *expression2)
      : expression1_(expression1), expression2_(expression2) {}

  Expression *expression1_{nullptr};
  Expression *expression2_{nullptr};
};

#define TRELLIS_UNARY_OPERATOR(name)                                    \
  class name : public UnaryOperator {                                   \
   public:                                                              \
    DEFVISITABLE(ExpressionVisitor)                                     \
    explicit name(Expression *expression) : UnaryOperator(expression) {} \
  };

#define TRELLIS_BINARY_OPERATOR(name)                                                                          \
  class name : public BinaryOperator {                                                                         \
   public:                                                                                                     \
    DEFVISITABLE(ExpressionVisitor)                                                                            \
    name(Expression *expression1, Expression *expression2) : BinaryOperator(expression1, expression2) {}       \
  };

TRELLIS_UNARY_OPERATOR(NotOperator)
TRELLIS_UNARY_OPERATOR(UnaryMinusOperator)
TRELLIS_UNARY_OPERATOR(UnaryPlusOperator)

TRELLIS_BINARY_OPERATOR(OrOperator)
TRELLIS_BINARY_OPERATOR(AndOperator)
TRELLIS_BINARY_OPERATOR(EqualOperator)
TRELLIS_BINARY_OPERATOR(NotEqualOperator)
TRELLIS_BINARY_OPERATOR(LessOperator)
TRELLIS_BINARY_OPERATOR(LessEqualOperator)
TRELLIS_BINARY_OPERATOR(GreaterOperator)
TRELLIS_BINARY_OPERATOR(GreaterEqualOperator)
TRELLIS_BINARY_OPERATOR(AdditionOperator)
TRELLIS_BINARY_OPERATOR(SubtractionOperator)
TRELLIS_BINARY_OPERATOR(ConcatOperator)
TRELLIS_BINARY_OPERATOR(MultiplicationOperator)
TRELLIS_BINARY_OPERATOR(DivisionOperator)
TRELLIS_BINARY_OPERATOR(ModOperator)

#undef TRELLIS_UNARY_OPERATOR
#undef TRELLIS_BINARY_OPERATOR

/// `condition ? then_expression : else_expression`
class IfOperator : public Expression {
 public:
  DEFVISITABLE(ExpressionVisitor)

  IfOperator(Expression *condition, Expression *then_expression, Expression *else_expression)
      : condition_(condition), then_expression_(then_expression), else_expression_(else_expression) {}

  Expression *condition_{nullptr};
  Expression *then_expression_{nullptr};
  Expression *else_expression_{nullptr};
};

/// Assigns to an @c Identifier, @c PropertyLookup or @c IndexingOperator.
class Assignment : public Expression {
 public:
  DEFVISITABLE(ExpressionVisitor)

  Assignment(Expression *target, Expression *value) : target_(target), value_(value) {}

  Expression *target_{nullptr};
  Expression *value_{nullptr};
};

/// `var name = value`, `value_` is nullptr without an initializer.
class VariableDeclaration : public Expression {
 public:
  DEFVISITABLE(ExpressionVisitor)

  VariableDeclaration(std::string name, Expression *value) : name_(std::move(name)), value_(value) {}

  std::string name_;
  Expression *value_{nullptr};
};

/// Statements separated by `;`. Evaluates to the value of the last one.
class StatementList : public Expression {
 public:
  DEFVISITABLE(ExpressionVisitor)

  StatementList() = default;
  explicit StatementList(std::vector<Expression *> statements) : statements_(std::move(statements)) {}

  std::vector<Expression *> statements_;
};

}  // namespace trellis::expr
