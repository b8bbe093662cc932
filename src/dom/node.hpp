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

/// @file node.hpp
///
/// @brief Owned markup tree used by the parser, the template expander and the
/// serializer.
///
/// Every node owns its children through @c std::unique_ptr and keeps a raw
/// back pointer to its parent. The tree is only ever mutated through the
/// whole-node operations declared here (@c ReplaceWith, @c RemoveFromTree,
/// @c StripOut, @c StealChildren), so it stays a proper tree at all times.

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <fmt/ostream.h>

namespace trellis::dom {

class Node;
class Element;

using NodePtr = std::unique_ptr<Node>;
using Attributes = std::vector<std::pair<std::string, std::string>>;

enum class NodeType : uint8_t { Element, Text, RawHtml, Comment, EmbeddedCode, Fragment };

std::ostream &operator<<(std::ostream &os, NodeType type);

class Node {
 public:
  Node(const Node &) = delete;
  Node &operator=(const Node &) = delete;
  Node(Node &&) = delete;
  Node &operator=(Node &&) = delete;
  virtual ~Node();

  NodeType type() const { return type_; }
  bool IsElement() const { return type_ == NodeType::Element; }

  Node *parent() const { return parent_; }

  /// Expires when this node is destroyed.
  std::weak_ptr<bool> liveness() const { return alive_; }
  const std::vector<NodePtr> &children() const { return children_; }

  /// Plain pointers to the current children. Stays valid while the children
  /// are moved around, as long as none of them is destroyed.
  std::vector<Node *> ChildrenSnapshot() const;

  Node *AppendChild(NodePtr child);
  Node *PrependChild(NodePtr child);
  Node *InsertChild(size_t position, NodePtr child);

  /// Position of this node among its parent's children.
  size_t IndexInParent() const;

  /// Detaches this node and returns ownership of it.
  NodePtr RemoveFromTree();

  /// Puts `replacement` where this node was and hands back ownership of this
  /// node. A fragment replacement is dissolved: its children are spliced in
  /// its place.
  NodePtr ReplaceWith(NodePtr replacement);

  /// Replaces this node with its own children.
  NodePtr StripOut();

  /// Moves every child out of this node.
  std::vector<NodePtr> StealChildren();

  void RemoveAllChildren();

  /// Deep copy without a parent.
  virtual NodePtr Clone() const = 0;

  /// Serializes the node itself.
  virtual void WriteHtml(std::string *out) const = 0;

  /// Concatenated text of the subtree.
  virtual std::string TextContent() const;

  std::string ToHtml() const;
  std::string InnerHtml() const;

 protected:
  explicit Node(NodeType type) : type_(type) {}

  void WriteChildren(std::string *out) const;
  void CloneChildrenInto(Node *copy) const;

 private:
  NodeType type_;
  Node *parent_{nullptr};
  std::vector<NodePtr> children_;
  std::shared_ptr<bool> alive_{std::make_shared<bool>(true)};
};

class Element final : public Node {
 public:
  explicit Element(std::string tag_name, Attributes attributes = {});

  const std::string &tag_name() const { return tag_name_; }
  void set_tag_name(std::string tag_name) { tag_name_ = std::move(tag_name); }

  const Attributes &attributes() const { return attributes_; }

  bool HasAttribute(std::string_view name) const;
  /// Empty when the attribute is absent.
  std::string GetAttribute(std::string_view name) const;
  std::optional<std::string> FindAttribute(std::string_view name) const;
  void SetAttribute(std::string_view name, std::string value);
  void RemoveAttribute(std::string_view name);

  /// Adds every class in the whitespace separated `class_list` that the
  /// element does not carry yet.
  void AddClass(std::string_view class_list);
  bool HasClass(std::string_view class_name) const;

  /// Replaces the children with a single text node.
  void SetInnerText(std::string text);

  /// Elements such as `input` and `br` which never have content.
  bool IsVoid() const;

  NodePtr Clone() const override;
  void WriteHtml(std::string *out) const override;

 private:
  std::string tag_name_;
  Attributes attributes_;
};

class Text final : public Node {
 public:
  explicit Text(std::string text) : Node(NodeType::Text), text_(std::move(text)) {}

  const std::string &text() const { return text_; }
  void set_text(std::string text) { text_ = std::move(text); }

  NodePtr Clone() const override;
  void WriteHtml(std::string *out) const override;
  std::string TextContent() const override { return text_; }

 private:
  std::string text_;
};

/// Markup written out verbatim. Holds the content of raw tags such as
/// `script` and markup inserted unescaped.
class RawHtml final : public Node {
 public:
  explicit RawHtml(std::string html) : Node(NodeType::RawHtml), html_(std::move(html)) {}

  const std::string &html() const { return html_; }
  void set_html(std::string html) { html_ = std::move(html); }

  NodePtr Clone() const override;
  void WriteHtml(std::string *out) const override;
  std::string TextContent() const override { return html_; }

 private:
  std::string html_;
};

class Comment final : public Node {
 public:
  explicit Comment(std::string text) : Node(NodeType::Comment), text_(std::move(text)) {}

  const std::string &text() const { return text_; }

  NodePtr Clone() const override;
  void WriteHtml(std::string *out) const override;
  std::string TextContent() const override { return {}; }

 private:
  std::string text_;
};

/// An inline `<% ... %>` block. The code is everything between the
/// delimiters, so `<%= x %>` holds `= x `.
class EmbeddedCode final : public Node {
 public:
  explicit EmbeddedCode(std::string code) : Node(NodeType::EmbeddedCode), code_(std::move(code)) {}

  const std::string &code() const { return code_; }

  NodePtr Clone() const override;
  void WriteHtml(std::string *out) const override;
  std::string TextContent() const override { return {}; }

 private:
  std::string code_;
};

/// Ordered siblings without a tag of their own.
class Fragment final : public Node {
 public:
  Fragment() : Node(NodeType::Fragment) {}

  NodePtr Clone() const override;
  void WriteHtml(std::string *out) const override;
};

/// Root element plus whatever precedes it in the source (doctype, comments).
class Document {
 public:
  Document() = default;
  Document(std::string prolog, std::unique_ptr<Element> root) : prolog_(std::move(prolog)), root_(std::move(root)) {}

  const std::string &prolog() const { return prolog_; }
  Element *root() const { return root_.get(); }
  std::unique_ptr<Element> ReleaseRoot() { return std::move(root_); }

  std::string ToHtml() const;

 private:
  std::string prolog_;
  std::unique_ptr<Element> root_;
};

/// Tags such as `input` and `br` which never have content.
bool IsVoidElement(std::string_view tag_name);

template <typename T>
T *As(Node *node) {
  return dynamic_cast<T *>(node);
}

template <typename T>
const T *As(const Node *node) {
  return dynamic_cast<const T *>(node);
}

/// Descendant elements of `root` (not `root` itself) matching `predicate`, in
/// document order.
std::vector<Element *> FindAll(const Node &root, const std::function<bool(const Element &)> &predicate);

Element *FindFirst(const Node &root, const std::function<bool(const Element &)> &predicate);

std::vector<Element *> FindAllByTagName(const Node &root, std::string_view tag_name);

Element *GetElementById(const Node &root, std::string_view id);

/// Element children of `node`, skipping text and other node kinds.
std::vector<Element *> ChildElements(const Node &node);

Element *FirstChildElement(const Node &node, std::string_view tag_name);

}  // namespace trellis::dom

template <>
class fmt::formatter<trellis::dom::NodeType> : public fmt::ostream_formatter {};
