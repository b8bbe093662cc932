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
#include <vector>

#include "expr/ast.hpp"

namespace trellis::expr {

struct Token {
  enum class Type {
    END,
    NUMBER,
    STRING,
    IDENTIFIER,
    KEYWORD,
    PUNCTUATION,
  };

  Type type{Type::END};
  std::string text;
  /// Offset of the token in the source.
  size_t position{0};
};

/// Splits expression source into tokens.
/// @throw SyntaxException on unterminated strings and unknown characters.
std::vector<Token> Tokenize(std::string_view source);

/**
 * Parses a `;` separated list of statements into `storage`.
 *
 * Grammar, lowest precedence first:
 *   statement   := 'var' IDENTIFIER ('=' expression)? | expression
 *   expression  := pipeline ('=' expression)?
 *   pipeline    := conditional ('|>' postfix)*
 *   conditional := or ('?' expression ':' expression)?
 *   or          := and ('||' and)*
 *   and         := equality ('&&' equality)*
 *   equality    := relational (('==' | '!=') relational)*
 *   relational  := additive (('<' | '<=' | '>' | '>=') additive)*
 *   additive    := term (('+' | '-' | '~') term)*
 *   term        := unary (('*' | '/' | '%') unary)*
 *   unary       := ('!' | '-' | '+') unary | postfix
 *   postfix     := primary ('.' IDENTIFIER | '[' expression ']' | '(' arguments ')')*
 *
 * `a |> f(b)` is parsed as `f(a, b)`.
 *
 * @throw SyntaxException
 */
StatementList *ParseStatements(std::string_view source, AstStorage *storage);

}  // namespace trellis::expr
