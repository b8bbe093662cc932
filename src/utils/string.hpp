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

/** @file */
#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "utils/exceptions.hpp"

namespace trellis::utils {

/** Remove whitespace characters from the start of a string. */
inline std::string_view LTrim(const std::string_view s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  return std::string_view(s.data() + start, s.size() - start);
}

/** Remove characters found in `chars` from the start of a string. */
inline std::string_view LTrim(const std::string_view s, const std::string_view chars) {
  size_t start = 0;
  while (start < s.size() && chars.find(s[start]) != std::string::npos) {
    ++start;
  }
  return std::string_view(s.data() + start, s.size() - start);
}

/** Remove whitespace characters from the end of a string. */
inline std::string_view RTrim(const std::string_view s) {
  size_t count = s.size();
  while (count > static_cast<size_t>(0) && std::isspace(static_cast<unsigned char>(s[count - 1]))) {
    --count;
  }
  return std::string_view(s.data(), count);
}

/** Remove characters found in `chars` from the end of a string. */
inline std::string_view RTrim(const std::string_view s, const std::string_view chars) {
  size_t count = s.size();
  while (count > static_cast<size_t>(0) && chars.find(s[count - 1]) != std::string::npos) {
    --count;
  }
  return std::string_view(s.data(), count);
}

/** Remove whitespace characters from the start and from the end of a string. */
inline std::string_view Trim(const std::string_view s) {
  size_t start = 0;
  size_t count = s.size();
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
    ++start;
  }
  while (count > start && std::isspace(static_cast<unsigned char>(s[count - 1]))) {
    --count;
  }
  return std::string_view(s.data() + start, count - start);
}

/** Remove characters found in `chars` from the start and the end of `s`. */
inline std::string_view Trim(const std::string_view s, const std::string_view chars) {
  size_t start = 0;
  size_t count = s.size();
  while (start < s.size() && chars.find(s[start]) != std::string::npos) {
    ++start;
  }
  while (count > start && chars.find(s[count - 1]) != std::string::npos) {
    --count;
  }
  return std::string_view(s.data() + start, count - start);
}

/**
 * Lowercase all characters of a string and store the result in `out`.
 * Transformation is locale independent.
 * @return pointer to `out`.
 */
template <class TAllocator>
std::basic_string<char, std::char_traits<char>, TAllocator> *ToLowerCase(
    std::basic_string<char, std::char_traits<char>, TAllocator> *out, const std::string_view s) {
  out->resize(s.size());
  std::transform(s.begin(), s.end(), out->begin(),
                 [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
  return out;
}

/**
 * Lowercase all characters of a string.
 * Transformation is locale independent.
 */
inline std::string ToLowerCase(const std::string_view s) {
  std::string res;
  ToLowerCase(&res, s);
  return res;
}

/**
 * Join the `strings` collection separated by a given separator into `out`.
 * @return pointer to `out`.
 */
template <class TCollection, class TAllocator>
std::basic_string<char, std::char_traits<char>, TAllocator> *Join(
    std::basic_string<char, std::char_traits<char>, TAllocator> *out, const TCollection &strings,
    const std::string_view separator) {
  out->clear();
  if (strings.empty()) return out;
  int64_t total_size = 0;
  for (const auto &x : strings) {
    total_size += x.size();
  }
  total_size += separator.size() * (static_cast<int64_t>(strings.size()) - 1);
  out->reserve(total_size);
  *out += strings[0];
  for (auto it = strings.begin() + 1; it != strings.end(); ++it) {
    *out += separator;
    *out += *it;
  }
  return out;
}

/**
 * Join the `strings` collection separated by a given separator.
 */
inline std::string Join(const std::vector<std::string> &strings, const std::string_view separator) {
  std::string res;
  Join(&res, strings, separator);
  return res;
}

/**
 * Replace all occurrences of `match` in `src` with `replacement`.
 * @return pointer to `out`.
 */
template <class TAllocator>
std::basic_string<char, std::char_traits<char>, TAllocator> *Replace(
    std::basic_string<char, std::char_traits<char>, TAllocator> *out, const std::string_view src,
    const std::string_view match, const std::string_view replacement) {
  // TODO: This could be implemented much more efficiently.
  *out = src;
  for (size_t pos = out->find(match); pos != std::string::npos; pos = out->find(match, pos + replacement.size())) {
    out->erase(pos, match.length()).insert(pos, replacement);
  }
  return out;
}

/** Replace all occurrences of `match` in `src` with `replacement`. */
inline std::string Replace(const std::string_view src, const std::string_view match,
                           const std::string_view replacement) {
  std::string res;
  Replace(&res, src, match, replacement);
  return res;
}

/**
 * Split a string by `delimiter` with a maximum of `splits` into a vector.
 * The vector will have at most `splits` + 1 elements. Negative value of
 * `splits` indicates to perform all possible splits.
 * @return pointer to `out`.
 */
template <class TString, class TAllocator>
std::vector<TString, TAllocator> *Split(std::vector<TString, TAllocator> *out, const std::string_view src,
                                        const std::string_view delimiter, int splits = -1) {
  out->clear();
  if (src.empty()) return out;
  size_t index = 0;
  while (splits < 0 || splits-- != 0) {
    auto n = src.find(delimiter, index);
    if (n == std::string::npos) break;
    out->emplace_back(src.substr(index, n - index));
    index = n + delimiter.size();
  }
  out->emplace_back(src.substr(index));
  return out;
}

/**
 * Split a string by `delimiter` with a maximum of `splits` into a vector.
 * The vector will have at most `splits` + 1 elements. Negative value of
 * `splits` indicates to perform all possible splits.
 */
inline std::vector<std::string> Split(const std::string_view src, const std::string_view delimiter, int splits = -1) {
  std::vector<std::string> res;
  Split(&res, src, delimiter, splits);
  return res;
}

/**
 * Split a string by whitespace into a vector.
 * Runs of consecutive whitespace are regarded as a single delimiter.
 * Additionally, the result will not contain empty strings at the start or end
 * as if the string was trimmed before splitting.
 * @return pointer to `out`.
 */
template <class TString, class TAllocator>
std::vector<TString, TAllocator> *Split(std::vector<TString, TAllocator> *out, const std::string_view src) {
  out->clear();
  if (src.empty()) return out;
  // TODO: Investigate how much regex allocate and perhaps replace with custom
  // solution doing no allocations.
  static std::regex not_whitespace("[^\\s]+");
  auto matches_begin = std::cregex_iterator(src.data(), src.data() + src.size(), not_whitespace);
  auto matches_end = std::cregex_iterator();
  out->reserve(std::distance(matches_begin, matches_end));
  for (auto match = matches_begin; match != matches_end; ++match) {
    std::string_view match_view(&src[match->position()], match->length());
    out->emplace_back(match_view);
  }
  return out;
}

/**
 * Split a string by whitespace into a vector.
 * Runs of consecutive whitespace are regarded as a single delimiter.
 * Additionally, the result will not contain empty strings at the start or end
 * as if the string was trimmed before splitting.
 */
inline std::vector<std::string> Split(const std::string_view src) {
  std::vector<std::string> res;
  Split(&res, src);
  return res;
}

/** Perform case-insensitive string equality test. */
inline bool IEquals(const std::string_view lhs, const std::string_view rhs) {
  if (lhs.size() != rhs.size()) return false;
  for (size_t i = 0; i < lhs.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(lhs[i])) != std::tolower(static_cast<unsigned char>(rhs[i]))) {
      return false;
    }
  }
  return true;
}

/**
 * Replace every `things[i].first` with `things[i].second` in `what` in a
 * single left-to-right pass. At each position the earliest match wins, ties go
 * to the pair listed first. Replacement text is never rescanned.
 */
std::string MultiReplace(std::string_view what, const std::vector<std::pair<std::string_view, std::string_view>> &things);

/**
 * Escape `&`, `<` and `>` for use in HTML text content. When `for_attribute`
 * is set, `"` is escaped as well.
 */
std::string EscapeHtml(std::string_view text, bool for_attribute = false);

}  // namespace trellis::utils
