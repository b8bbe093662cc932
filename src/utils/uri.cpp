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

#include "utils/uri.hpp"

#include <cctype>
#include <regex>

#include <fmt/format.h>

namespace trellis::utils {

namespace {

std::optional<std::string> MatchedOrNullopt(const std::cmatch &match, size_t index) {
  if (!match[index].matched) return std::nullopt;
  return match[index].str();
}

std::string MergePaths(const Uri &base, std::string_view reference_path) {
  if (base.authority && base.path.empty()) {
    return fmt::format("/{}", reference_path);
  }
  auto last_slash = base.path.rfind('/');
  if (last_slash == std::string::npos) return std::string(reference_path);
  return base.path.substr(0, last_slash + 1) + std::string(reference_path);
}

bool IsUnreserved(unsigned char c) {
  if (std::isalnum(c)) return true;
  switch (c) {
    case '-':
    case '_':
    case '.':
    case '!':
    case '~':
    case '*':
    case '\'':
    case '(':
    case ')':
      return true;
    default:
      return false;
  }
}

}  // namespace

Uri Uri::Parse(std::string_view text) {
  static const std::regex kUriReference(R"(^(([^:/?#]+):)?(//([^/?#]*))?([^?#]*)(\?([^#]*))?(#(.*))?)");

  Uri uri;
  std::cmatch match;
  if (!std::regex_search(text.data(), text.data() + text.size(), match, kUriReference)) {
    uri.path = text;
    return uri;
  }
  uri.scheme = MatchedOrNullopt(match, 2);
  uri.authority = MatchedOrNullopt(match, 4);
  uri.path = match[5].str();
  uri.query = MatchedOrNullopt(match, 7);
  uri.fragment = MatchedOrNullopt(match, 9);
  return uri;
}

Uri Uri::BasedOn(const Uri &base) const {
  Uri target;
  if (scheme) {
    target.scheme = scheme;
    target.authority = authority;
    target.path = RemoveDotSegments(path);
    target.query = query;
  } else {
    if (authority) {
      target.authority = authority;
      target.path = RemoveDotSegments(path);
      target.query = query;
    } else {
      if (path.empty()) {
        target.path = base.path;
        target.query = query ? query : base.query;
      } else {
        if (path.front() == '/') {
          target.path = RemoveDotSegments(path);
        } else {
          target.path = RemoveDotSegments(MergePaths(base, path));
        }
        target.query = query;
      }
      target.authority = base.authority;
    }
    target.scheme = base.scheme;
  }
  target.fragment = fragment;
  return target;
}

std::string Uri::ToString() const {
  std::string result;
  if (scheme) {
    result += *scheme;
    result += ':';
  }
  if (authority) {
    result += "//";
    result += *authority;
  }
  result += path;
  if (query) {
    result += '?';
    result += *query;
  }
  if (fragment) {
    result += '#';
    result += *fragment;
  }
  return result;
}

std::string RemoveDotSegments(std::string_view path) {
  std::string output;
  while (!path.empty()) {
    if (path.starts_with("../")) {
      path.remove_prefix(3);
    } else if (path.starts_with("./")) {
      path.remove_prefix(2);
    } else if (path.starts_with("/./")) {
      path.remove_prefix(2);
    } else if (path == "/.") {
      path = "/";
    } else if (path.starts_with("/../") || path == "/..") {
      if (path == "/..") {
        path = "/";
      } else {
        path.remove_prefix(3);
      }
      auto last_slash = output.rfind('/');
      output.erase(last_slash == std::string::npos ? 0 : last_slash);
    } else if (path == "." || path == "..") {
      path = {};
    } else {
      auto segment_end = path.find('/', path.front() == '/' ? 1 : 0);
      if (segment_end == std::string_view::npos) segment_end = path.size();
      output += path.substr(0, segment_end);
      path.remove_prefix(segment_end);
    }
  }
  return output;
}

std::string EncodeUriComponent(std::string_view component) {
  std::string result;
  result.reserve(component.size());
  for (auto c : component) {
    auto byte = static_cast<unsigned char>(c);
    if (IsUnreserved(byte)) {
      result += c;
    } else {
      result += fmt::format("%{:02X}", byte);
    }
  }
  return result;
}

}  // namespace trellis::utils
