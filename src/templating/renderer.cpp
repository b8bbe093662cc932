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

#include "templating/renderer.hpp"

#include <spdlog/spdlog.h>

#include "templating/default_functions.hpp"
#include "templating/exceptions.hpp"
#include "utils/exceptions.hpp"
#include "utils/uri.hpp"

namespace trellis::templating {

namespace {

bool HasTagName(const dom::Element &element, std::string_view tag_name) { return element.tag_name() == tag_name; }

dom::Element &RequireElement(dom::Element *element, std::string_view description) {
  if (!element) throw StructuralMergeException("The skeleton has no {}", description);
  return *element;
}

}  // namespace

WebTemplateRenderer::WebTemplateRenderer(const TemplateLoader &loader, EmbeddedTagTranslators translators,
                                         RenderOptions options)
    : loader_(loader),
      options_(std::move(options)),
      expander_(loader_, std::move(translators), options_.annotate_templates) {}

dom::Document WebTemplateRenderer::RenderTemplate(std::string_view template_name, expr::Context &context,
                                                  expr::Context &skeleton_context,
                                                  std::string_view skeleton_name) const {
  try {
    return Render(template_name, context, skeleton_context, skeleton_name);
  } catch (const utils::BasicException &e) {
    throw RenderException(std::string(template_name), context.Flatten(), e.name(), e.what());
  } catch (const std::exception &e) {
    throw RenderException(std::string(template_name), context.Flatten(), utils::GetExceptionName(e), e.what());
  }
}

void WebTemplateRenderer::AddDefaultFunctions(expr::Context &context) const {
  templating::AddDefaultFunctions(context);
}

dom::Document WebTemplateRenderer::Render(std::string_view template_name, expr::Context &context,
                                          expr::Context &skeleton_context, std::string_view skeleton_name) const {
  const std::string skeleton_file(skeleton_name.empty() ? std::string_view(options_.default_skeleton) : skeleton_name);
  spdlog::debug("Rendering template {} inside {}", template_name, skeleton_file);

  AddDefaultFunctions(context);
  AddDefaultFunctions(skeleton_context);

  auto skeleton = expander_.ParseTemplate(skeleton_file, loader_.LoadTemplateHtml(skeleton_file), false);
  auto content = expander_.ParseTemplate(template_name, loader_.LoadTemplateHtml(template_name), true);

  expander_.Expand(*skeleton.root(), skeleton_context);
  ResolveRelativeLinks(*skeleton.root());

  expander_.Expand(*content.root(), context);

  MergeContentIntoSkeleton(*content.root(), *skeleton.root());

  if (options_.annotate_templates) {
    skeleton.root()->PrependChild(
        std::make_unique<dom::Comment>(fmt::format(" {} inside {} ", template_name, skeleton_file)));
  }

  PostProcess(skeleton);
  return skeleton;
}

void ResolveRelativeLinks(dom::Element &root) {
  auto bases = dom::FindAll(root, [](const dom::Element &element) { return element.HasAttribute("data-relative-to"); });
  if (root.HasAttribute("data-relative-to")) bases.insert(bases.begin(), &root);

  for (auto *base_element : bases) {
    auto base = utils::Uri::Parse(base_element->GetAttribute("data-relative-to"));
    for (auto *anchor : dom::FindAllByTagName(*base_element, "a")) {
      auto href = anchor->FindAttribute("href");
      if (!href) continue;
      anchor->SetAttribute("href", utils::Uri::Parse(*href).BasedOn(base).ToString());
    }
  }
}

void MergeContentIntoSkeleton(dom::Element &content_root, dom::Element &skeleton_root) {
  auto *content_main = dom::FirstChildElement(content_root, "main");
  if (!content_main) throw StructuralMergeException("The template has no top-level <main>");

  if (auto body_class = content_main->FindAttribute("body-class")) {
    auto &body = RequireElement(
        dom::FindFirst(skeleton_root, [](const dom::Element &element) { return HasTagName(element, "body"); }),
        "<body>");
    body.AddClass(*body_class);
    content_main->RemoveAttribute("body-class");
  }

  auto &skeleton_main = RequireElement(
      dom::FindFirst(skeleton_root, [](const dom::Element &element) { return HasTagName(element, "main"); }),
      "<main>");
  skeleton_main.ReplaceWith(content_main->RemoveFromTree());

  if (auto *content_title = dom::FirstChildElement(content_root, "title")) {
    auto *head = dom::FirstChildElement(skeleton_root, "head");
    auto &skeleton_title = RequireElement(head ? dom::FirstChildElement(*head, "title") : nullptr, "<head><title>");
    skeleton_title.RemoveAllChildren();
    for (const auto &child : content_title->children()) skeleton_title.AppendChild(child->Clone());
  }

  for (auto *item : dom::ChildElements(content_root)) {
    auto id = item->FindAttribute("id");
    if (!id) continue;
    auto *target = dom::GetElementById(skeleton_root, *id);
    if (!target) throw StructuralMergeException("The skeleton has no element with the id '{}'", *id);
    target->ReplaceWith(item->RemoveFromTree());
  }

  for (auto *fragment : dom::FindAllByTagName(skeleton_root, "document-fragment")) fragment->StripOut();
}

}  // namespace trellis::templating
