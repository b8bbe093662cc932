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

#include "templating/expander.hpp"

#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "expr/interpret.hpp"
#include "templating/exceptions.hpp"
#include "templating/form_populator.hpp"
#include "utils/exceptions.hpp"

namespace trellis::templating {

namespace {

constexpr std::string_view kMarkerOpen = "<%=";
constexpr std::string_view kMarkerClose = "%>";

// Replaces each `<%= expr %>` in `text` with `encode(value of expr)`.
template <typename TEncode>
std::string ReplaceMarkers(std::string_view text, expr::Context &context, std::string_view where,
                           const TEncode &encode) {
  std::string result;
  size_t pos = 0;
  while (true) {
    auto open = text.find(kMarkerOpen, pos);
    if (open == std::string_view::npos) break;
    auto code_begin = open + kMarkerOpen.size();
    auto close = text.find(kMarkerClose, code_begin);
    if (close == std::string_view::npos) {
      throw MalformedTemplateException("Unclosed {} marker in {}", kMarkerOpen, where);
    }
    result.append(text.substr(pos, open - pos));
    result.append(encode(expr::Interpret(text.substr(code_begin, close - code_begin), context)));
    pos = close + kMarkerClose.size();
  }
  if (pos == 0) return std::string(text);
  result.append(text.substr(pos));
  return result;
}

std::unique_ptr<dom::Fragment> StealIntoFragment(dom::Node &node) {
  auto fragment = std::make_unique<dom::Fragment>();
  for (auto &child : node.StealChildren()) fragment->AppendChild(std::move(child));
  return fragment;
}

}  // namespace

Expander::Expander(const TemplateLoader &loader, EmbeddedTagTranslators translators, bool annotate_partials)
    : loader_(loader), translators_(std::move(translators)), annotate_partials_(annotate_partials) {
  for (const auto &[tag, translator] : translators_) parse_options_.raw_tag_names.insert(tag);
}

void Expander::Expand(dom::Node &root, expr::Context &context) const {
  auto *element = dom::As<dom::Element>(&root);
  if (element) ExpandAttributes(*element, context);
  ExpandChildren(root, context);
  if (element && element->HasAttribute("onrender")) RunOnRender(*element, context);
}

std::string Expander::SubstituteMarkers(std::string_view text, expr::Context &context) const {
  return ReplaceMarkers(text, context, "attribute", [](const expr::TypedValue &value) { return value.ToText(); });
}

dom::Document Expander::ParseTemplate(std::string_view name, std::string_view html, bool wrap_in_root) const {
  try {
    if (wrap_in_root) return dom::ParseHtml(fmt::format("<root>{}</root>", html), parse_options_);
    return dom::ParseHtml(html, parse_options_);
  } catch (const utils::ParseException &e) {
    throw MalformedTemplateException("Malformed template '{}': {}", name, e.what());
  }
}

void Expander::ExpandAttributes(dom::Element &element, expr::Context &context) const {
  // Copy, substitution rewrites the attribute list.
  auto attributes = element.attributes();
  for (const auto &[name, value] : attributes) {
    if (name == "onrender") continue;
    auto substituted = SubstituteMarkers(value, context);
    if (substituted != value) element.SetAttribute(name, std::move(substituted));
  }
}

void Expander::ExpandChildren(dom::Node &root, expr::Context &context) const {
  // Whether the last if-true or for-each among these siblings produced
  // output. Never shared with the expansion of nested elements.
  bool prior_outcome = false;

  for (auto *child : root.ChildrenSnapshot()) {
    if (auto *code = dom::As<dom::EmbeddedCode>(child)) {
      ExpandEmbeddedCode(*code, context);
      continue;
    }
    auto *element = dom::As<dom::Element>(child);
    if (!element) continue;

    const auto &tag = element->tag_name();
    if (tag == "if-true") {
      ExpandIfTrue(*element, context, &prior_outcome);
    } else if (tag == "or-else") {
      ExpandOrElse(*element, context, prior_outcome);
    } else if (tag == "for-each") {
      ExpandForEach(*element, context, &prior_outcome);
    } else if (tag == "render-template") {
      ExpandRenderTemplate(*element, context);
    } else if (tag == "hidden-form-data") {
      ExpandHiddenFormData(*element, context);
    } else if (tag == "script") {
      ExpandScript(*element, context);
    } else if (auto it = translators_.find(tag); it != translators_.end()) {
      ExpandTranslated(*element, it->second, context);
    } else {
      Expand(*element, context);
    }
  }
}

void Expander::ExpandIfTrue(dom::Element &element, expr::Context &context, bool *prior_outcome) const {
  *prior_outcome = expr::Interpret(element.GetAttribute("cond"), context).ToBool();
  if (!*prior_outcome) {
    element.RemoveFromTree();
    return;
  }
  ExpandChildren(element, context);
  element.StripOut();
}

void Expander::ExpandOrElse(dom::Element &element, expr::Context &context, bool prior_outcome) const {
  if (prior_outcome) {
    element.RemoveFromTree();
    return;
  }
  ExpandChildren(element, context);
  element.StripOut();
}

void Expander::ExpandForEach(dom::Element &element, expr::Context &context, bool *prior_outcome) const {
  auto items = expr::Interpret(element.GetAttribute("over"), context).Items();
  const auto as = element.GetAttribute("as");
  const auto index = element.GetAttribute("index");

  auto fragment = std::make_unique<dom::Fragment>();
  for (auto &[key, item] : items) {
    expr::Context iteration_context(&context);
    iteration_context.Set(as, std::move(item));
    if (!index.empty()) iteration_context.Set(index, std::move(key));

    auto clone = element.Clone();
    ExpandChildren(*clone, iteration_context);
    for (auto &node : clone->StealChildren()) fragment->AppendChild(std::move(node));
  }
  *prior_outcome = !items.empty();
  element.ReplaceWith(std::move(fragment));
}

void Expander::ExpandRenderTemplate(dom::Element &element, expr::Context &context) const {
  const auto file = element.GetAttribute("file");
  spdlog::debug("Rendering partial {}", file);
  auto partial = ParseTemplate(file, loader_.LoadTemplateHtml(file), true);

  expr::Context partial_context(&context);
  if (auto data = element.FindAttribute("data")) {
    nlohmann::ordered_json json;
    try {
      json = nlohmann::ordered_json::parse(*data);
    } catch (const nlohmann::json::parse_error &e) {
      throw MalformedTemplateException("Invalid JSON in the data of partial '{}': {}", file, e.what());
    }
    partial_context.Set("data", expr::TypedValue::FromJson(json));
  }
  Expand(*partial.root(), partial_context);

  auto fragment = std::make_unique<dom::Fragment>();
  if (annotate_partials_) fragment->AppendChild(std::make_unique<dom::Comment>(fmt::format(" {} ", file)));
  for (auto &node : partial.root()->StealChildren()) fragment->AppendChild(std::move(node));
  if (annotate_partials_) fragment->AppendChild(std::make_unique<dom::Comment>(fmt::format(" end {} ", file)));
  element.ReplaceWith(std::move(fragment));
}

void Expander::ExpandHiddenFormData(dom::Element &element, expr::Context &context) const {
  auto from = expr::Interpret(element.GetAttribute("from"), context);
  dom::Element form("form");
  PopulateForm(form, from, element.GetAttribute("name"));
  element.ReplaceWith(StealIntoFragment(form));
}

void Expander::ExpandEmbeddedCode(dom::EmbeddedCode &code, expr::Context &context) const {
  std::string_view source = code.code();
  if (!source.starts_with('=')) {
    expr::Interpret(source, context);
    code.RemoveFromTree();
    return;
  }
  if (source.size() > 5 && source.substr(1, 4) == "HTML") {
    auto value = expr::Interpret(source.substr(5), context);
    if (value.IsNode()) {
      code.ReplaceWith(value.ValueNode().Resolve().Clone());
    } else {
      code.ReplaceWith(std::make_unique<dom::RawHtml>(value.ToText()));
    }
    return;
  }
  auto value = expr::Interpret(source.substr(1), context);
  code.ReplaceWith(std::make_unique<dom::Text>(value.ToText()));
}

void Expander::ExpandScript(dom::Element &script, expr::Context &context) const {
  ExpandAttributes(script, context);
  auto source = script.InnerHtml();
  auto replaced =
      ReplaceMarkers(source, context, "script", [](const expr::TypedValue &value) { return value.ToScriptJson(); });
  if (replaced == source) return;
  script.RemoveAllChildren();
  script.AppendChild(std::make_unique<dom::RawHtml>(std::move(replaced)));
}

void Expander::ExpandTranslated(dom::Element &element, const EmbeddedTagTranslator &translator,
                                expr::Context &context) const {
  spdlog::debug("Translating embedded <{}>", element.tag_name());
  auto result = translator(element.InnerHtml(), element.attributes());
  if (!result.node) {
    element.RemoveFromTree();
    return;
  }
  if (result.scan_for_template_content) {
    if (auto *text = dom::As<dom::Text>(result.node.get())) {
      text->set_text(SubstituteMarkers(text->text(), context));
    } else {
      Expand(*result.node, context);
    }
  }
  element.ReplaceWith(std::move(result.node));
}

void Expander::RunOnRender(dom::Element &element, expr::Context &context) const {
  const auto source = element.GetAttribute("onrender");
  spdlog::trace("Running onrender of <{}>: {}", element.tag_name(), source);

  auto self = expr::TypedValue::BorrowNode(&element);
  self.SetMember("populateFrom", expr::TypedValue(expr::TypedValue::TFunction(
                                     [&element, alive = element.liveness()](const expr::TypedValue &this_value,
                                                                            std::vector<expr::TypedValue> args) {
                                       if (alive.expired()) {
                                         throw expr::TypedValueException(
                                             "populateFrom called after its form was destroyed");
                                       }
                                       if (element.tag_name() != "form" || args.empty()) return this_value;
                                       for (const auto &[key, item] : args[0].Items()) {
                                         PopulateForm(element, item, key.ToText());
                                       }
                                       return this_value;
                                     })));

  expr::Context render_context(&context);
  render_context.Set("this", std::move(self));
  expr::Interpret(source, render_context);
  element.RemoveAttribute("onrender");
}

}  // namespace trellis::templating
