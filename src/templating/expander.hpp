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

#include <functional>
#include <map>
#include <string>
#include <string_view>

#include "dom/node.hpp"
#include "dom/parser.hpp"
#include "expr/context.hpp"
#include "templating/loader.hpp"

namespace trellis::templating {

/// What an embedded tag translator produced. Without a node the tag is
/// removed. When `scan_for_template_content` is set the node is expanded like
/// template markup (a text node only gets its `<%= %>` markers substituted).
struct EmbeddedTagResult {
  dom::NodePtr node;
  bool scan_for_template_content{true};
};

/// Turns a custom tag into markup. Receives the raw source between the tag's
/// start and end tags and the tag's attributes.
using EmbeddedTagTranslator =
    std::function<EmbeddedTagResult(std::string_view inner_source, const dom::Attributes &attributes)>;

/// Translators by tag name. Content of these tags is not parsed as markup.
using EmbeddedTagTranslators = std::map<std::string, EmbeddedTagTranslator, std::less<>>;

/**
 * Rewrites a template tree in place.
 *
 * Expanding an element substitutes `<%= %>` markers in its attributes, then
 * walks its children in document order:
 *   - `if-true cond`, `or-else` and `for-each over as index` are replaced by
 *     their expanded children, or removed. An `or-else` is kept when the last
 *     `if-true` or `for-each` before it among the same siblings produced
 *     nothing.
 *   - `render-template file data` is replaced by the expanded partial.
 *   - `hidden-form-data from name` is replaced by hidden inputs holding the
 *     flattened value.
 *   - `<%= %>` nodes become text, `<%=HTML %>` nodes raw markup and `<% %>`
 *     nodes are evaluated and dropped.
 *   - `script` elements get their markers replaced by JSON.
 *   - Tags with a registered translator are replaced by its result.
 *   - Any other element is expanded recursively.
 * Finally an `onrender` attribute is evaluated with `this` bound to the
 * element and removed.
 *
 * Any failure propagates and leaves the tree half expanded.
 */
class Expander {
 public:
  Expander(const TemplateLoader &loader, EmbeddedTagTranslators translators, bool annotate_partials = false);

  void Expand(dom::Node &root, expr::Context &context) const;

  /// Replaces every `<%= expr %>` in `text` with the text form of `expr`.
  /// @throw MalformedTemplateException on a marker without `%>`.
  std::string SubstituteMarkers(std::string_view text, expr::Context &context) const;

  /// Parses template markup with the raw tags of this expander. With
  /// `wrap_in_root` the markup may have any number of top-level nodes; they
  /// end up under a synthetic `root` element.
  /// @throw MalformedTemplateException
  dom::Document ParseTemplate(std::string_view name, std::string_view html, bool wrap_in_root) const;

  const dom::ParseOptions &parse_options() const { return parse_options_; }

 private:
  void ExpandAttributes(dom::Element &element, expr::Context &context) const;
  void ExpandChildren(dom::Node &root, expr::Context &context) const;

  void ExpandIfTrue(dom::Element &element, expr::Context &context, bool *prior_outcome) const;
  void ExpandOrElse(dom::Element &element, expr::Context &context, bool prior_outcome) const;
  void ExpandForEach(dom::Element &element, expr::Context &context, bool *prior_outcome) const;
  void ExpandRenderTemplate(dom::Element &element, expr::Context &context) const;
  void ExpandHiddenFormData(dom::Element &element, expr::Context &context) const;
  void ExpandEmbeddedCode(dom::EmbeddedCode &code, expr::Context &context) const;
  void ExpandScript(dom::Element &script, expr::Context &context) const;
  void ExpandTranslated(dom::Element &element, const EmbeddedTagTranslator &translator,
                        expr::Context &context) const;
  void RunOnRender(dom::Element &element, expr::Context &context) const;

  const TemplateLoader &loader_;
  EmbeddedTagTranslators translators_;
  bool annotate_partials_;
  dom::ParseOptions parse_options_;
};

}  // namespace trellis::templating
