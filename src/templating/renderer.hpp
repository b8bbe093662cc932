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

#include "dom/node.hpp"
#include "expr/context.hpp"
#include "templating/expander.hpp"
#include "templating/loader.hpp"

namespace trellis::templating {

struct RenderOptions {
  /// Skeleton used when RenderTemplate gets no skeleton name.
  std::string default_skeleton{"skeleton.html"};
  /// Mark where templates and partials begin and end with comments.
  bool annotate_templates{false};
};

/**
 * Renders a content template inside a skeleton page.
 *
 * Both documents are expanded against their own context. The content's
 * top-level `main` then replaces the skeleton's `main`, its top-level `title`
 * fills the skeleton's `head > title` and every other top-level element with
 * an id replaces the skeleton element with the same id. `document-fragment`
 * elements left in the skeleton are replaced by their children.
 *
 * Subclasses can bind more functions into the contexts and adjust the
 * finished document.
 */
class WebTemplateRenderer {
 public:
  explicit WebTemplateRenderer(const TemplateLoader &loader, EmbeddedTagTranslators translators = {},
                               RenderOptions options = {});

  WebTemplateRenderer(const WebTemplateRenderer &) = delete;
  WebTemplateRenderer &operator=(const WebTemplateRenderer &) = delete;
  WebTemplateRenderer(WebTemplateRenderer &&) = delete;
  WebTemplateRenderer &operator=(WebTemplateRenderer &&) = delete;
  virtual ~WebTemplateRenderer() = default;

  /// @throw RenderException wrapping whatever went wrong.
  dom::Document RenderTemplate(std::string_view template_name, expr::Context &context,
                               expr::Context &skeleton_context, std::string_view skeleton_name = "") const;

  /// Called for both contexts before anything is expanded.
  virtual void AddDefaultFunctions(expr::Context &context) const;

  /// Called with the finished document. Does nothing by default.
  virtual void PostProcess(dom::Document & /*document*/) const {}

  const Expander &expander() const { return expander_; }

 private:
  dom::Document Render(std::string_view template_name, expr::Context &context, expr::Context &skeleton_context,
                       std::string_view skeleton_name) const;

  const TemplateLoader &loader_;
  RenderOptions options_;
  Expander expander_;
};

/// Rewrites the `href` of every `a` below an element carrying
/// `data-relative-to` so that it is resolved against that attribute's URI.
void ResolveRelativeLinks(dom::Element &root);

/// Moves the expanded content document into the expanded skeleton.
/// @throw StructuralMergeException when an element the merge needs is missing.
void MergeContentIntoSkeleton(dom::Element &content_root, dom::Element &skeleton_root);

}  // namespace trellis::templating
