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

#include "dom/parser.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <utility>
#include <vector>

#include "utils/exceptions.hpp"
#include "utils/logging.hpp"
#include "utils/string.hpp"

namespace trellis::dom {

namespace {

using namespace std::string_view_literals;

constexpr std::array kNamedEntities{std::pair{"amp"sv, "&"sv},  std::pair{"lt"sv, "<"sv},
                                    std::pair{"gt"sv, ">"sv},   std::pair{"quot"sv, "\""sv},
                                    std::pair{"apos"sv, "'"sv}, std::pair{"nbsp"sv, "\xC2\xA0"sv}};

bool IsNameChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == ':' || c == '.';
}

bool IsSpace(char c) { return std::isspace(static_cast<unsigned char>(c)); }

void AppendUtf8(uint32_t code_point, std::string *out) {
  if (code_point < 0x80) {
    *out += static_cast<char>(code_point);
  } else if (code_point < 0x800) {
    *out += static_cast<char>(0xC0 | (code_point >> 6));
    *out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else if (code_point < 0x10000) {
    *out += static_cast<char>(0xE0 | (code_point >> 12));
    *out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (code_point & 0x3F));
  } else {
    *out += static_cast<char>(0xF0 | (code_point >> 18));
    *out += static_cast<char>(0x80 | ((code_point >> 12) & 0x3F));
    *out += static_cast<char>(0x80 | ((code_point >> 6) & 0x3F));
    *out += static_cast<char>(0x80 | (code_point & 0x3F));
  }
}

// Decodes the reference between '&' and ';'. Returns false if it is not one
// we know, in which case the text is kept untouched.
bool DecodeReference(std::string_view reference, std::string *out) {
  if (reference.size() > 1 && reference[0] == '#') {
    auto digits = reference.substr(1);
    int base = 10;
    if (digits[0] == 'x' || digits[0] == 'X') {
      digits.remove_prefix(1);
      base = 16;
    }
    uint32_t code_point{0};
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), code_point, base);
    if (ec != std::errc() || ptr != digits.data() + digits.size() || digits.empty() || code_point > 0x10FFFF) {
      return false;
    }
    AppendUtf8(code_point, out);
    return true;
  }
  for (const auto &[name, value] : kNamedEntities) {
    if (name == reference) {
      *out += value;
      return true;
    }
  }
  return false;
}

class Parser {
 public:
  Parser(std::string_view text, const ParseOptions &options) : text_(text), options_(options) {}

  std::unique_ptr<Fragment> Parse() {
    auto fragment = std::make_unique<Fragment>();
    open_.push_back(fragment.get());
    while (pos_ < text_.size()) {
      if (text_[pos_] == '<' && ParseMarkup()) continue;
      ParseText();
    }
    if (open_.size() > 1) {
      throw utils::ParseException("Unclosed element <{}>", As<Element>(open_.back())->tag_name());
    }
    return fragment;
  }

 private:
  // Handles whatever starts at a '<'. Returns false when the '<' is plain
  // text.
  bool ParseMarkup() {
    auto rest = text_.substr(pos_);
    if (rest.starts_with("<%")) {
      auto end = Require("%>", pos_ + 2, "<% block");
      Current()->AppendChild(std::make_unique<EmbeddedCode>(std::string(text_.substr(pos_ + 2, end - pos_ - 2))));
      pos_ = end + 2;
      return true;
    }
    if (rest.starts_with("<!--")) {
      auto end = Require("-->", pos_ + 4, "comment");
      Current()->AppendChild(std::make_unique<Comment>(std::string(text_.substr(pos_ + 4, end - pos_ - 4))));
      pos_ = end + 3;
      return true;
    }
    if (rest.starts_with("<!") || rest.starts_with("<?")) {
      auto end = Require(">", pos_ + 2, "declaration");
      Current()->AppendChild(std::make_unique<RawHtml>(std::string(text_.substr(pos_, end + 1 - pos_))));
      pos_ = end + 1;
      return true;
    }
    if (rest.starts_with("</")) {
      ParseClosingTag();
      return true;
    }
    if (rest.size() > 1 && std::isalpha(static_cast<unsigned char>(rest[1]))) {
      ParseOpeningTag();
      return true;
    }
    return false;
  }

  void ParseText() {
    // A leading '<' that did not start markup belongs to the text.
    auto end = text_.find('<', pos_ + 1);
    if (end == std::string_view::npos) end = text_.size();
    auto decoded = DecodeEntities(text_.substr(pos_, end - pos_));
    pos_ = end;
    const auto &siblings = Current()->children();
    if (!siblings.empty()) {
      if (auto *previous = As<Text>(siblings.back().get())) {
        previous->set_text(previous->text() + decoded);
        return;
      }
    }
    Current()->AppendChild(std::make_unique<Text>(std::move(decoded)));
  }

  void ParseClosingTag() {
    auto end = Require(">", pos_ + 2, "closing tag");
    auto name = utils::ToLowerCase(utils::Trim(text_.substr(pos_ + 2, end - pos_ - 2)));
    pos_ = end + 1;
    // `</br>` and friends close nothing.
    if (IsVoidElement(name)) return;
    auto *current = As<Element>(Current());
    if (!current) throw utils::ParseException("Unexpected closing tag </{}> at offset {}", name, end);
    if (current->tag_name() != name) {
      throw utils::ParseException("Unexpected closing tag </{}> at offset {}, expected </{}>", name, end,
                                  current->tag_name());
    }
    open_.pop_back();
  }

  void ParseOpeningTag() {
    auto start = pos_;
    ++pos_;
    auto name_begin = pos_;
    while (pos_ < text_.size() && IsNameChar(text_[pos_])) ++pos_;
    auto name = utils::ToLowerCase(text_.substr(name_begin, pos_ - name_begin));

    Attributes attributes;
    bool self_closing = false;
    while (true) {
      SkipSpace();
      if (pos_ >= text_.size()) throw utils::ParseException("Unterminated tag <{}> at offset {}", name, start);
      if (text_[pos_] == '>') {
        ++pos_;
        break;
      }
      if (text_.substr(pos_).starts_with("/>")) {
        pos_ += 2;
        self_closing = true;
        break;
      }
      attributes.push_back(ParseAttribute(name));
    }

    auto element = std::make_unique<Element>(name, std::move(attributes));
    auto *raw = Current()->AppendChild(std::move(element));
    if (self_closing || As<Element>(raw)->IsVoid()) return;

    if (options_.raw_tag_names.contains(name)) {
      auto [content_end, tag_end] = FindRawClosingTag(name, start);
      if (content_end > pos_) {
        raw->AppendChild(std::make_unique<RawHtml>(std::string(text_.substr(pos_, content_end - pos_))));
      }
      pos_ = tag_end;
      return;
    }
    open_.push_back(raw);
  }

  std::pair<std::string, std::string> ParseAttribute(std::string_view tag_name) {
    auto name_begin = pos_;
    while (pos_ < text_.size() && !IsSpace(text_[pos_]) && text_[pos_] != '=' && text_[pos_] != '>' &&
           !text_.substr(pos_).starts_with("/>")) {
      ++pos_;
    }
    if (pos_ == name_begin) {
      throw utils::ParseException("Invalid attribute in tag <{}> at offset {}", tag_name, pos_);
    }
    std::string name(text_.substr(name_begin, pos_ - name_begin));
    SkipSpace();
    if (pos_ >= text_.size() || text_[pos_] != '=') return {std::move(name), ""};
    ++pos_;
    SkipSpace();
    if (pos_ >= text_.size()) throw utils::ParseException("Missing value for attribute {}", name);

    auto quote = text_[pos_];
    if (quote != '"' && quote != '\'') {
      auto value_begin = pos_;
      while (pos_ < text_.size() && !IsSpace(text_[pos_]) && text_[pos_] != '>') ++pos_;
      return {std::move(name), DecodeEntities(text_.substr(value_begin, pos_ - value_begin))};
    }

    ++pos_;
    auto value_begin = pos_;
    while (pos_ < text_.size() && text_[pos_] != quote) {
      if (text_.substr(pos_).starts_with("<%")) {
        pos_ = Require("%>", pos_ + 2, "<% block in attribute") + 2;
        continue;
      }
      ++pos_;
    }
    if (pos_ >= text_.size()) throw utils::ParseException("Unterminated value for attribute {}", name);
    auto value = DecodeEntities(text_.substr(value_begin, pos_ - value_begin));
    ++pos_;
    return {std::move(name), std::move(value)};
  }

  // Returns the offset where the raw content ends and the offset just past the
  // closing tag.
  std::pair<size_t, size_t> FindRawClosingTag(std::string_view name, size_t tag_start) const {
    auto search = pos_;
    while (true) {
      auto candidate = text_.find("</", search);
      if (candidate == std::string_view::npos) {
        throw utils::ParseException("Unclosed element <{}> at offset {}", name, tag_start);
      }
      auto after = candidate + 2;
      if (utils::IEquals(text_.substr(after, name.size()), name)) {
        auto close = after + name.size();
        while (close < text_.size() && IsSpace(text_[close])) ++close;
        if (close < text_.size() && text_[close] == '>') return {candidate, close + 1};
      }
      search = after;
    }
  }

  size_t Require(std::string_view terminator, size_t from, std::string_view what) const {
    auto end = text_.find(terminator, from);
    if (end == std::string_view::npos) {
      throw utils::ParseException("Unterminated {} starting at offset {}", what, pos_);
    }
    return end;
  }

  void SkipSpace() {
    while (pos_ < text_.size() && IsSpace(text_[pos_])) ++pos_;
  }

  Node *Current() const { return open_.back(); }

  std::string_view text_;
  const ParseOptions &options_;
  size_t pos_{0};
  std::vector<Node *> open_;
};

bool IsBlank(const Node &node) {
  const auto *text = As<Text>(&node);
  return text && utils::Trim(text->text()).empty();
}

}  // namespace

std::string DecodeEntities(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  size_t pos = 0;
  while (pos < text.size()) {
    auto amp = text.find('&', pos);
    if (amp == std::string_view::npos) {
      out += text.substr(pos);
      break;
    }
    out += text.substr(pos, amp - pos);
    auto semicolon = text.find(';', amp + 1);
    if (semicolon == std::string_view::npos || semicolon - amp > 10 ||
        !DecodeReference(text.substr(amp + 1, semicolon - amp - 1), &out)) {
      out += '&';
      pos = amp + 1;
      continue;
    }
    pos = semicolon + 1;
  }
  return out;
}

std::unique_ptr<Fragment> ParseHtmlFragment(std::string_view text, const ParseOptions &options) {
  return Parser(text, options).Parse();
}

Document ParseHtml(std::string_view text, const ParseOptions &options) {
  auto fragment = ParseHtmlFragment(text, options);
  std::string prolog;
  std::unique_ptr<Element> root;
  for (auto &child : fragment->StealChildren()) {
    if (child->IsElement()) {
      if (root) throw utils::ParseException("Document has more than one root element: <{}> and <{}>",
                                            root->tag_name(), As<Element>(child.get())->tag_name());
      root.reset(As<Element>(child.release()));
      continue;
    }
    if (child->type() == NodeType::Text && !IsBlank(*child)) {
      throw utils::ParseException("Text '{}' outside of the document root element",
                                  utils::Trim(As<Text>(child.get())->text()));
    }
    // Everything up to the root is kept as the prolog, trailing comments are dropped.
    if (!root) child->WriteHtml(&prolog);
  }
  if (!root) throw utils::ParseException("Document of {} characters has no root element", text.size());
  return {std::move(prolog), std::move(root)};
}

}  // namespace trellis::dom
