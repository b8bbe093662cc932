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

#include "utils/string.hpp"

std::string trellis::utils::MultiReplace(std::string_view what,
                                         const std::vector<std::pair<std::string_view, std::string_view>> &things) {
  if (things.empty()) return std::string(what);

  std::string res;
  res.reserve(what.size());
  while (!what.empty()) {
    auto next_index = what.size();
    const std::pair<std::string_view, std::string_view> *next_thing = nullptr;
    for (const auto &thing : things) {
      if (thing.first.empty()) continue;
      auto idx = what.find(thing.first);
      if (idx != std::string_view::npos && idx < next_index) {
        next_index = idx;
        next_thing = &thing;
      }
    }

    if (next_thing == nullptr) {
      res += what;
      break;
    }
    res += what.substr(0, next_index);
    res += next_thing->second;
    what.remove_prefix(next_index + next_thing->first.size());
  }
  return res;
}

std::string trellis::utils::EscapeHtml(std::string_view const text, bool const for_attribute) {
  std::string res;
  res.reserve(text.size());
  for (auto c : text) {
    switch (c) {
      case '&':
        res += "&amp;";
        break;
      case '<':
        res += "&lt;";
        break;
      case '>':
        res += "&gt;";
        break;
      case '"':
        if (for_attribute) {
          res += "&quot;";
        } else {
          res += c;
        }
        break;
      default:
        res += c;
    }
  }
  return res;
}
