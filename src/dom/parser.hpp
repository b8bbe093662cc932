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

#include <memory>
#include <set>
#include <string>
#include <string_view>

#include "dom/node.hpp"

namespace trellis::dom {

struct ParseOptions {
  /// Tags whose content is kept verbatim up to the matching closing tag.
  std::set<std::string, std::less<>> raw_tag_names{"script", "style"};
};

/**
 * Parses markup into a list of sibling nodes.
 *
 * The parser is strict about nesting: every non-void element has to be closed
 * by a matching tag, and `<x/>` closes any element. `<% ... %>` blocks become
 * @c EmbeddedCode nodes when they appear in text; inside quoted attribute
 * values they are kept as part of the value and quotes inside them do not end
 * the value. Entity references in text and attribute values are decoded.
 *
 * @throw utils::ParseException on malformed markup.
 */
std::unique_ptr<Fragment> ParseHtmlFragment(std::string_view text, const ParseOptions &options = {});

/**
 * Parses a whole document: an optional prolog (doctype, processing
 * instructions, comments) and exactly one root element.
 *
 * @throw utils::ParseException on malformed markup or when there is not
 * exactly one root element.
 */
Document ParseHtml(std::string_view text, const ParseOptions &options = {});

/// Decodes `&amp;`, `&lt;`, `&gt;`, `&quot;`, `&apos;`, `&nbsp;` and numeric
/// character references. Anything else is left as is.
std::string DecodeEntities(std::string_view text);

}  // namespace trellis::dom
