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

#include <optional>
#include <string>
#include <string_view>

namespace trellis::utils {

/// URI reference split into its RFC 3986 components. Components that were
/// absent from the parsed text are nullopt, which is different from present
/// but empty (e.g. `http://host?` has an empty query).
struct Uri {
  std::optional<std::string> scheme;
  std::optional<std::string> authority;
  std::string path;
  std::optional<std::string> query;
  std::optional<std::string> fragment;

  /// Splits `text` using the regular expression from RFC 3986 appendix B. Any
  /// string is a valid URI reference under that grammar, so this never fails.
  static Uri Parse(std::string_view text);

  /// Resolves this reference against `base` (RFC 3986 section 5.2.2).
  Uri BasedOn(const Uri &base) const;

  /// Recomposes the components (RFC 3986 section 5.3).
  std::string ToString() const;

  bool operator==(const Uri &) const = default;
};

/// Removes `.` and `..` segments from a path (RFC 3986 section 5.2.4).
std::string RemoveDotSegments(std::string_view path);

/// Percent-encodes every byte except the unreserved characters
/// `A-Z a-z 0-9 - _ . ! ~ * ' ( )`, like JavaScript's encodeURIComponent.
std::string EncodeUriComponent(std::string_view component);

}  // namespace trellis::utils
