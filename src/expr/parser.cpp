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

#include "expr/parser.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>

#include "expr/exceptions.hpp"

namespace trellis::expr {

namespace {

using namespace std::string_view_literals;

// Longest first so that `===` wins over `==` and `=`.
constexpr std::array kPunctuation{"===", "!==", "==", "!=", "<=", ">=", "&&", "||", "|>", "(", ")", "[", "]",
                                  "{",   "}",   ",",  ".",  ";",  ":",  "?",  "!",  "=",  "<", ">", "+", "-",
                                  "*",   "/",   "%",  "~"};

constexpr std::array kKeywords{"true"sv, "false"sv, "null"sv, "var"sv};

bool IsIdentifierStart(char c) { return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$'; }

bool IsIdentifierChar(char c) { return IsIdentifierStart(c) || std::isdigit(static_cast<unsigned char>(c)); }

bool IsDigit(char c) { return std::isdigit(static_cast<unsigned char>(c)); }

void AppendUtf8(uint32_t code_point, std::string *out) {
  if (code_point < 0x80) {
    *out += static_cast<char>(code_point);
  } else if (code_point < 0x800) {
    *out += static_cast<char>(0xC0 | (code_point >> 6));
    *out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else {
    *out += static_cast<char>(0xE0 | (code_point >> 12));
    *out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (code_point & 0x3F));
  }
}

class Lexer {
 public:
  explicit Lexer(std::string_view source) : source_(source) {}

  std::vector<Token> Tokenize() {
    std::vector<Token> tokens;
    while (true) {
      SkipSpaceAndComments();
      if (pos_ >= source_.size()) break;
      tokens.push_back(NextToken());
    }
    tokens.push_back(Token{Token::Type::END, "", source_.size()});
    return tokens;
  }

 private:
  Token NextToken() {
    auto start = pos_;
    auto c = source_[pos_];
    if (IsDigit(c) || (c == '.' && pos_ + 1 < source_.size() && IsDigit(source_[pos_ + 1]))) {
      return Token{Token::Type::NUMBER, ReadNumber(), start};
    }
    if (c == '"' || c == '\'') {
      return Token{Token::Type::STRING, ReadString(), start};
    }
    if (IsIdentifierStart(c)) {
      while (pos_ < source_.size() && IsIdentifierChar(source_[pos_])) ++pos_;
      std::string word(source_.substr(start, pos_ - start));
      bool keyword = std::find(kKeywords.begin(), kKeywords.end(), word) != kKeywords.end();
      return Token{keyword ? Token::Type::KEYWORD : Token::Type::IDENTIFIER, std::move(word), start};
    }
    for (std::string_view punctuation : kPunctuation) {
      if (source_.substr(pos_).starts_with(punctuation)) {
        pos_ += punctuation.size();
        return Token{Token::Type::PUNCTUATION, std::string(punctuation), start};
      }
    }
    throw SyntaxException("Unexpected character '{}' at position {}", c, start);
  }

  void SkipSpaceAndComments() {
    while (pos_ < source_.size()) {
      if (std::isspace(static_cast<unsigned char>(source_[pos_]))) {
        ++pos_;
      } else if (source_.substr(pos_).starts_with("//")) {
        auto end = source_.find('\n', pos_);
        pos_ = end == std::string_view::npos ? source_.size() : end + 1;
      } else if (source_.substr(pos_).starts_with("/*")) {
        auto end = source_.find("*/", pos_ + 2);
        if (end == std::string_view::npos) throw SyntaxException("Unterminated comment at position {}", pos_);
        pos_ = end + 2;
      } else {
        break;
      }
    }
  }

  std::string ReadNumber() {
    auto start = pos_;
    while (pos_ < source_.size() && IsDigit(source_[pos_])) ++pos_;
    if (pos_ < source_.size() && source_[pos_] == '.') {
      ++pos_;
      while (pos_ < source_.size() && IsDigit(source_[pos_])) ++pos_;
    }
    if (pos_ < source_.size() && (source_[pos_] == 'e' || source_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < source_.size() && (source_[pos_] == '+' || source_[pos_] == '-')) ++pos_;
      if (pos_ >= source_.size() || !IsDigit(source_[pos_])) {
        throw SyntaxException("Malformed number at position {}", start);
      }
      while (pos_ < source_.size() && IsDigit(source_[pos_])) ++pos_;
    }
    return std::string(source_.substr(start, pos_ - start));
  }

  std::string ReadString() {
    auto start = pos_;
    auto quote = source_[pos_++];
    std::string value;
    while (pos_ < source_.size() && source_[pos_] != quote) {
      auto c = source_[pos_++];
      if (c != '\\') {
        value += c;
        continue;
      }
      if (pos_ >= source_.size()) break;
      auto escaped = source_[pos_++];
      switch (escaped) {
        case 'n':
          value += '\n';
          break;
        case 't':
          value += '\t';
          break;
        case 'r':
          value += '\r';
          break;
        case 'b':
          value += '\b';
          break;
        case 'f':
          value += '\f';
          break;
        case '0':
          value += '\0';
          break;
        case 'u': {
          uint32_t code_point{0};
          auto digits = source_.substr(pos_, 4);
          auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), code_point, 16);
          if (digits.size() != 4 || ec != std::errc() || ptr != digits.data() + digits.size()) {
            throw SyntaxException("Malformed \\u escape at position {}", pos_ - 2);
          }
          AppendUtf8(code_point, &value);
          pos_ += 4;
          break;
        }
        default:
          value += escaped;
          break;
      }
    }
    if (pos_ >= source_.size()) throw SyntaxException("Unterminated string starting at position {}", start);
    ++pos_;
    return value;
  }

  std::string_view source_;
  size_t pos_{0};
};

class Parser {
 public:
  Parser(std::vector<Token> tokens, AstStorage *storage) : tokens_(std::move(tokens)), storage_(storage) {}

  StatementList *ParseStatementList() {
    std::vector<Expression *> statements;
    while (true) {
      while (Accept(";")) {
      }
      if (Peek().type == Token::Type::END) break;
      statements.push_back(ParseStatement());
      if (Peek().type != Token::Type::END && !Check(";")) {
        Fail("Expected ';'");
      }
    }
    return storage_->Create<StatementList>(std::move(statements));
  }

 private:
  Expression *ParseStatement() {
    if (Peek().type == Token::Type::KEYWORD && Peek().text == "var") {
      Advance();
      if (Peek().type != Token::Type::IDENTIFIER) Fail("Expected a variable name");
      auto name = Advance().text;
      Expression *value = nullptr;
      if (Accept("=")) value = ParseExpression();
      return storage_->Create<VariableDeclaration>(std::move(name), value);
    }
    return ParseExpression();
  }

  Expression *ParseExpression() {
    auto *target = ParsePipeline();
    if (!Check("=")) return target;
    if (!dynamic_cast<Identifier *>(target) && !dynamic_cast<PropertyLookup *>(target) &&
        !dynamic_cast<IndexingOperator *>(target)) {
      Fail("Invalid assignment target");
    }
    Advance();
    return storage_->Create<Assignment>(target, ParseExpression());
  }

  Expression *ParsePipeline() {
    auto *expression = ParseConditional();
    while (Accept("|>")) {
      auto *function = ParsePostfix();
      if (auto *call = dynamic_cast<FunctionCall *>(function)) {
        call->arguments_.insert(call->arguments_.begin(), expression);
        expression = call;
      } else {
        expression = storage_->Create<FunctionCall>(function, std::vector<Expression *>{expression});
      }
    }
    return expression;
  }

  Expression *ParseConditional() {
    auto *condition = ParseOr();
    if (!Accept("?")) return condition;
    auto *then_expression = ParseExpression();
    Expect(":");
    auto *else_expression = ParseConditional();
    return storage_->Create<IfOperator>(condition, then_expression, else_expression);
  }

  Expression *ParseOr() {
    auto *expression = ParseAnd();
    while (Accept("||")) expression = storage_->Create<OrOperator>(expression, ParseAnd());
    return expression;
  }

  Expression *ParseAnd() {
    auto *expression = ParseEquality();
    while (Accept("&&")) expression = storage_->Create<AndOperator>(expression, ParseEquality());
    return expression;
  }

  Expression *ParseEquality() {
    auto *expression = ParseRelational();
    while (true) {
      if (Accept("==") || Accept("===")) {
        expression = storage_->Create<EqualOperator>(expression, ParseRelational());
      } else if (Accept("!=") || Accept("!==")) {
        expression = storage_->Create<NotEqualOperator>(expression, ParseRelational());
      } else {
        return expression;
      }
    }
  }

  Expression *ParseRelational() {
    auto *expression = ParseAdditive();
    while (true) {
      if (Accept("<")) {
        expression = storage_->Create<LessOperator>(expression, ParseAdditive());
      } else if (Accept("<=")) {
        expression = storage_->Create<LessEqualOperator>(expression, ParseAdditive());
      } else if (Accept(">")) {
        expression = storage_->Create<GreaterOperator>(expression, ParseAdditive());
      } else if (Accept(">=")) {
        expression = storage_->Create<GreaterEqualOperator>(expression, ParseAdditive());
      } else {
        return expression;
      }
    }
  }

  Expression *ParseAdditive() {
    auto *expression = ParseTerm();
    while (true) {
      if (Accept("+")) {
        expression = storage_->Create<AdditionOperator>(expression, ParseTerm());
      } else if (Accept("-")) {
        expression = storage_->Create<SubtractionOperator>(expression, ParseTerm());
      } else if (Accept("~")) {
        expression = storage_->Create<ConcatOperator>(expression, ParseTerm());
      } else {
        return expression;
      }
    }
  }

  Expression *ParseTerm() {
    auto *expression = ParseUnary();
    while (true) {
      if (Accept("*")) {
        expression = storage_->Create<MultiplicationOperator>(expression, ParseUnary());
      } else if (Accept("/")) {
        expression = storage_->Create<DivisionOperator>(expression, ParseUnary());
      } else if (Accept("%")) {
        expression = storage_->Create<ModOperator>(expression, ParseUnary());
      } else {
        return expression;
      }
    }
  }

  Expression *ParseUnary() {
    if (Accept("!")) return storage_->Create<NotOperator>(ParseUnary());
    if (Accept("-")) return storage_->Create<UnaryMinusOperator>(ParseUnary());
    if (Accept("+")) return storage_->Create<UnaryPlusOperator>(ParseUnary());
    return ParsePostfix();
  }

  Expression *ParsePostfix() {
    auto *expression = ParsePrimary();
    while (true) {
      if (Accept(".")) {
        if (Peek().type != Token::Type::IDENTIFIER && Peek().type != Token::Type::KEYWORD) {
          Fail("Expected a property name after '.'");
        }
        expression = storage_->Create<PropertyLookup>(expression, Advance().text);
      } else if (Accept("[")) {
        auto *index = ParseExpression();
        Expect("]");
        expression = storage_->Create<IndexingOperator>(expression, index);
      } else if (Accept("(")) {
        std::vector<Expression *> arguments;
        if (!Accept(")")) {
          do {
            arguments.push_back(ParseExpression());
          } while (Accept(","));
          Expect(")");
        }
        expression = storage_->Create<FunctionCall>(expression, std::move(arguments));
      } else {
        return expression;
      }
    }
  }

  Expression *ParsePrimary() {
    const auto &token = Peek();
    switch (token.type) {
      case Token::Type::NUMBER:
        return storage_->Create<PrimitiveLiteral>(ParseNumber(Advance()));
      case Token::Type::STRING:
        return storage_->Create<PrimitiveLiteral>(Advance().text);
      case Token::Type::IDENTIFIER:
        return storage_->Create<Identifier>(Advance().text);
      case Token::Type::KEYWORD:
        if (token.text == "true" || token.text == "false") {
          return storage_->Create<PrimitiveLiteral>(Advance().text == "true");
        }
        if (token.text == "null") {
          Advance();
          return storage_->Create<PrimitiveLiteral>();
        }
        break;
      case Token::Type::PUNCTUATION:
        if (Accept("(")) {
          auto *expression = ParseExpression();
          Expect(")");
          return expression;
        }
        if (Accept("[")) return ParseListLiteral();
        if (Accept("{")) return ParseMapLiteral();
        break;
      case Token::Type::END:
        Fail("Expected a value");
    }
    Fail(fmt::format("Unexpected '{}'", token.text));
  }

  Expression *ParseListLiteral() {
    std::vector<Expression *> elements;
    while (!Accept("]")) {
      elements.push_back(ParseExpression());
      if (!Accept(",")) {
        Expect("]");
        break;
      }
    }
    return storage_->Create<ListLiteral>(std::move(elements));
  }

  Expression *ParseMapLiteral() {
    std::vector<std::pair<std::string, Expression *>> elements;
    while (!Accept("}")) {
      const auto &key = Peek();
      if (key.type != Token::Type::IDENTIFIER && key.type != Token::Type::STRING &&
          key.type != Token::Type::NUMBER && key.type != Token::Type::KEYWORD) {
        Fail("Expected a property name in object literal");
      }
      auto name = Advance().text;
      Expect(":");
      elements.emplace_back(std::move(name), ParseExpression());
      if (!Accept(",")) {
        Expect("}");
        break;
      }
    }
    return storage_->Create<MapLiteral>(std::move(elements));
  }

  TypedValue ParseNumber(const Token &token) {
    const auto &text = token.text;
    const auto *end = text.data() + text.size();
    if (text.find_first_of(".eE") == std::string::npos) {
      int64_t value{0};
      auto [ptr, ec] = std::from_chars(text.data(), end, value);
      if (ec == std::errc() && ptr == end) return TypedValue(value);
    }
    double value{0};
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end) {
      throw SyntaxException("Invalid number '{}' at position {}", text, token.position);
    }
    return TypedValue(value);
  }

  const Token &Peek() const { return tokens_[index_]; }

  const Token &Advance() {
    const auto &token = tokens_[index_];
    if (token.type != Token::Type::END) ++index_;
    return token;
  }

  bool Check(std::string_view punctuation) const {
    return Peek().type == Token::Type::PUNCTUATION && Peek().text == punctuation;
  }

  bool Accept(std::string_view punctuation) {
    if (!Check(punctuation)) return false;
    Advance();
    return true;
  }

  void Expect(std::string_view punctuation) {
    if (!Accept(punctuation)) Fail(fmt::format("Expected '{}'", punctuation));
  }

  [[noreturn]] void Fail(std::string_view message) const {
    const auto &token = Peek();
    if (token.type == Token::Type::END) {
      throw SyntaxException("{} at end of expression", message);
    }
    throw SyntaxException("{} at position {}, near '{}'", message, token.position, token.text);
  }

  std::vector<Token> tokens_;
  size_t index_{0};
  AstStorage *storage_;
};

}  // namespace

std::vector<Token> Tokenize(std::string_view source) { return Lexer(source).Tokenize(); }

StatementList *ParseStatements(std::string_view source, AstStorage *storage) {
  return Parser(Tokenize(source), storage).ParseStatementList();
}

}  // namespace trellis::expr
