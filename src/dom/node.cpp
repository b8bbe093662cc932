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

#include "dom/node.hpp"

#include <algorithm>
#include <array>
#include <iterator>

#include "utils/logging.hpp"
#include "utils/string.hpp"

namespace trellis::dom {

namespace {

using namespace std::string_view_literals;

constexpr std::array kVoidElements{"area"sv, "base"sv, "br"sv,   "col"sv,   "embed"sv, "hr"sv,    "img"sv,
                                   "input"sv, "link"sv, "meta"sv, "param"sv, "source"sv, "track"sv, "wbr"sv};

void CollectMatching(const Node &node, const std::function<bool(const Element &)> &predicate,
                     std::vector<Element *> *out, bool first_only) {
  for (const auto &child : node.children()) {
    if (first_only && !out->empty()) return;
    if (auto *element = As<Element>(child.get()); element && predicate(*element)) {
      out->push_back(element);
      if (first_only) return;
    }
    CollectMatching(*child, predicate, out, first_only);
  }
}

}  // namespace

std::ostream &operator<<(std::ostream &os, NodeType type) {
  switch (type) {
    case NodeType::Element:
      return os << "element";
    case NodeType::Text:
      return os << "text";
    case NodeType::RawHtml:
      return os << "raw_html";
    case NodeType::Comment:
      return os << "comment";
    case NodeType::EmbeddedCode:
      return os << "embedded_code";
    case NodeType::Fragment:
      return os << "fragment";
  }
  LOG_FATAL("Unsupported dom::NodeType");
}

Node::~Node() = default;

std::vector<Node *> Node::ChildrenSnapshot() const {
  std::vector<Node *> snapshot;
  snapshot.reserve(children_.size());
  std::transform(children_.begin(), children_.end(), std::back_inserter(snapshot),
                 [](const auto &child) { return child.get(); });
  return snapshot;
}

Node *Node::AppendChild(NodePtr child) { return InsertChild(children_.size(), std::move(child)); }

Node *Node::PrependChild(NodePtr child) { return InsertChild(0, std::move(child)); }

Node *Node::InsertChild(size_t position, NodePtr child) {
  TR_ASSERT(child, "Inserting an empty node");
  TR_ASSERT(child->parent_ == nullptr, "Inserted node already has a parent");
  TR_ASSERT(position <= children_.size(), "Child position {} out of range", position);
  child->parent_ = this;
  auto *raw = child.get();
  children_.insert(children_.begin() + static_cast<std::ptrdiff_t>(position), std::move(child));
  return raw;
}

size_t Node::IndexInParent() const {
  TR_ASSERT(parent_, "Node has no parent");
  const auto &siblings = parent_->children_;
  auto it = std::find_if(siblings.begin(), siblings.end(), [this](const auto &sibling) { return sibling.get() == this; });
  TR_ASSERT(it != siblings.end(), "Node is missing from its parent's children");
  return static_cast<size_t>(std::distance(siblings.begin(), it));
}

NodePtr Node::RemoveFromTree() {
  TR_ASSERT(parent_, "Removing a node which is not in a tree");
  auto &siblings = parent_->children_;
  auto it = siblings.begin() + static_cast<std::ptrdiff_t>(IndexInParent());
  NodePtr self = std::move(*it);
  siblings.erase(it);
  parent_ = nullptr;
  return self;
}

NodePtr Node::ReplaceWith(NodePtr replacement) {
  TR_ASSERT(parent_, "Replacing a node which is not in a tree");
  auto *parent = parent_;
  auto position = IndexInParent();
  auto self = RemoveFromTree();
  if (!replacement) return self;

  if (replacement->type() == NodeType::Fragment) {
    for (auto &child : replacement->StealChildren()) {
      parent->InsertChild(position++, std::move(child));
    }
  } else {
    parent->InsertChild(position, std::move(replacement));
  }
  return self;
}

NodePtr Node::StripOut() {
  auto fragment = std::make_unique<Fragment>();
  for (auto &child : StealChildren()) fragment->AppendChild(std::move(child));
  return ReplaceWith(std::move(fragment));
}

std::vector<NodePtr> Node::StealChildren() {
  std::vector<NodePtr> stolen = std::move(children_);
  children_.clear();
  for (auto &child : stolen) child->parent_ = nullptr;
  return stolen;
}

void Node::RemoveAllChildren() { StealChildren(); }

std::string Node::TextContent() const {
  std::string text;
  for (const auto &child : children_) text += child->TextContent();
  return text;
}

std::string Node::ToHtml() const {
  std::string out;
  WriteHtml(&out);
  return out;
}

std::string Node::InnerHtml() const {
  std::string out;
  WriteChildren(&out);
  return out;
}

void Node::WriteChildren(std::string *out) const {
  for (const auto &child : children_) child->WriteHtml(out);
}

void Node::CloneChildrenInto(Node *copy) const {
  for (const auto &child : children_) copy->AppendChild(child->Clone());
}

Element::Element(std::string tag_name, Attributes attributes)
    : Node(NodeType::Element), tag_name_(std::move(tag_name)), attributes_(std::move(attributes)) {}

bool Element::HasAttribute(std::string_view name) const { return FindAttribute(name).has_value(); }

std::string Element::GetAttribute(std::string_view name) const { return FindAttribute(name).value_or(""); }

std::optional<std::string> Element::FindAttribute(std::string_view name) const {
  auto it = std::find_if(attributes_.begin(), attributes_.end(), [&](const auto &kv) { return kv.first == name; });
  if (it == attributes_.end()) return std::nullopt;
  return it->second;
}

void Element::SetAttribute(std::string_view name, std::string value) {
  auto it = std::find_if(attributes_.begin(), attributes_.end(), [&](const auto &kv) { return kv.first == name; });
  if (it == attributes_.end()) {
    attributes_.emplace_back(std::string(name), std::move(value));
  } else {
    it->second = std::move(value);
  }
}

void Element::RemoveAttribute(std::string_view name) {
  std::erase_if(attributes_, [&](const auto &kv) { return kv.first == name; });
}

bool Element::HasClass(std::string_view class_name) const {
  auto classes = utils::Split(GetAttribute("class"));
  return std::find(classes.begin(), classes.end(), class_name) != classes.end();
}

void Element::AddClass(std::string_view class_list) {
  auto classes = utils::Split(GetAttribute("class"));
  bool changed = false;
  for (auto &added : utils::Split(class_list)) {
    if (std::find(classes.begin(), classes.end(), added) != classes.end()) continue;
    classes.push_back(std::move(added));
    changed = true;
  }
  if (changed) SetAttribute("class", utils::Join(classes, " "));
}

void Element::SetInnerText(std::string text) {
  RemoveAllChildren();
  if (!text.empty()) AppendChild(std::make_unique<Text>(std::move(text)));
}

bool Element::IsVoid() const { return IsVoidElement(tag_name_); }

NodePtr Element::Clone() const {
  auto copy = std::make_unique<Element>(tag_name_, attributes_);
  CloneChildrenInto(copy.get());
  return copy;
}

void Element::WriteHtml(std::string *out) const {
  *out += '<';
  *out += tag_name_;
  for (const auto &[name, value] : attributes_) {
    *out += ' ';
    *out += name;
    *out += "=\"";
    *out += utils::EscapeHtml(value, true);
    *out += '"';
  }
  *out += '>';
  if (IsVoid() && children().empty()) return;
  WriteChildren(out);
  *out += "</";
  *out += tag_name_;
  *out += '>';
}

NodePtr Text::Clone() const { return std::make_unique<Text>(text_); }

void Text::WriteHtml(std::string *out) const { *out += utils::EscapeHtml(text_); }

NodePtr RawHtml::Clone() const { return std::make_unique<RawHtml>(html_); }

void RawHtml::WriteHtml(std::string *out) const { *out += html_; }

NodePtr Comment::Clone() const { return std::make_unique<Comment>(text_); }

void Comment::WriteHtml(std::string *out) const {
  *out += "<!--";
  *out += text_;
  *out += "-->";
}

NodePtr EmbeddedCode::Clone() const { return std::make_unique<EmbeddedCode>(code_); }

void EmbeddedCode::WriteHtml(std::string *out) const {
  *out += "<%";
  *out += code_;
  *out += "%>";
}

NodePtr Fragment::Clone() const {
  auto copy = std::make_unique<Fragment>();
  CloneChildrenInto(copy.get());
  return copy;
}

void Fragment::WriteHtml(std::string *out) const { WriteChildren(out); }

std::string Document::ToHtml() const {
  std::string out = prolog_;
  if (root_) root_->WriteHtml(&out);
  return out;
}

bool IsVoidElement(std::string_view tag_name) {
  return std::find(kVoidElements.begin(), kVoidElements.end(), tag_name) != kVoidElements.end();
}

std::vector<Element *> FindAll(const Node &root, const std::function<bool(const Element &)> &predicate) {
  std::vector<Element *> found;
  CollectMatching(root, predicate, &found, false);
  return found;
}

Element *FindFirst(const Node &root, const std::function<bool(const Element &)> &predicate) {
  std::vector<Element *> found;
  CollectMatching(root, predicate, &found, true);
  return found.empty() ? nullptr : found.front();
}

std::vector<Element *> FindAllByTagName(const Node &root, std::string_view tag_name) {
  return FindAll(root, [tag_name](const Element &element) { return element.tag_name() == tag_name; });
}

Element *GetElementById(const Node &root, std::string_view id) {
  return FindFirst(root, [id](const Element &element) {
    auto value = element.FindAttribute("id");
    return value && *value == id;
  });
}

std::vector<Element *> ChildElements(const Node &node) {
  std::vector<Element *> elements;
  for (const auto &child : node.children()) {
    if (auto *element = As<Element>(child.get())) elements.push_back(element);
  }
  return elements;
}

Element *FirstChildElement(const Node &node, std::string_view tag_name) {
  for (auto *element : ChildElements(node)) {
    if (element->tag_name() == tag_name) return element;
  }
  return nullptr;
}

}  // namespace trellis::dom
