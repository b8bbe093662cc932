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

/// @file visitor.hpp
///
/// @brief This file contains the generic implementation of visitor pattern.
///
/// Explanation on the classic visitor pattern can be found from many
/// sources, but here is the link to hopefully most easily accessible
/// information: https://en.wikipedia.org/wiki/Visitor_pattern
///
/// The idea behind the generic implementation of classic visitor pattern is to
/// allow returning any type via @c Accept and @c Visit methods. Traversing the
/// class hierarchy is relegated to the visitor classes. Therefore, visitor
/// should call @c Accept on children when visiting their parents.

#pragma once

namespace trellis::utils {

namespace detail {

template <typename R, class... T>
class VisitorBase;

template <typename R, class Head, class... Tail>
class VisitorBase<R, Head, Tail...> : public VisitorBase<R, Tail...> {
 public:
  using typename VisitorBase<R, Tail...>::ReturnType;
  using VisitorBase<R, Tail...>::Visit;
  virtual ReturnType Visit(Head &) = 0;
};

template <typename R, class T>
class VisitorBase<R, T> {
 public:
  /// @brief ReturnType of the @c Visit method.
  using ReturnType = R;
  virtual ~VisitorBase() = default;

  /// @brief Visit an instance of @c T.
  virtual ReturnType Visit(T &) = 0;
};

}  // namespace detail

/// @brief Inherit from this class if you want to visit TVisitable types.
///
/// Example usage:
/// @code
/// // Typedef for convenience or to establish a base class of visitors.
/// typedef Visitor<TypedValue, Identifier, AddOp> ExpressionVisitorBase;
/// class ExpressionVisitor : public ExpressionVisitorBase {
///  public:
///   using ExpressionVisitorBase::Visit;
///
///   TypedValue Visit(Identifier &ident) override {
///     // Visiting Identifier returns the value bound in the context.
///     return context_[ident];
///   }
///   TypedValue Visit(AddOp &add_op) override {
///     // Visiting '+' sums the evaluation of both sides.
///     auto res1 = add_op.expression1_->Accept(*this);
///     auto res2 = add_op.expression2_->Accept(*this);
///     return res1 + res2;
///   }
/// };
/// @endcode
///
/// @sa Visitable
template <typename TReturn, class... TVisitable>
class Visitor : public detail::VisitorBase<TReturn, TVisitable...> {
 public:
  using typename detail::VisitorBase<TReturn, TVisitable...>::ReturnType;
  using detail::VisitorBase<TReturn, TVisitable...>::Visit;
};

/// @brief Inherit from this class to allow visiting from TVisitor class.
///
/// Example usage:
/// @code
/// class Expression : public Visitable<ExpressionVisitor> { ... };
///
/// class Identifier : public Expression {
///  public:
///   DEFVISITABLE(ExpressionVisitor)
///   ....
/// };
/// @endcode
///
/// @sa DEFVISITABLE
/// @sa Visitor
template <class TVisitor>
class Visitable {
 public:
  virtual ~Visitable() = default;
  /// @brief Accept the @c TVisitor instance and call its @c Visit method.
  virtual typename TVisitor::ReturnType Accept(TVisitor &) = 0;

/// Default implementation for @c utils::Visitable::Accept, which works for
/// visitors of @c TVisitor type.
///
/// @sa utils::Visitable
#define DEFVISITABLE(TVisitor) \
  TVisitor::ReturnType Accept(TVisitor &visitor) override { return visitor.Visit(*this); }
};

}  // namespace trellis::utils
