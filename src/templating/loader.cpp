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

#include "templating/loader.hpp"

#include <spdlog/spdlog.h>

#include "templating/exceptions.hpp"
#include "utils/file.hpp"

namespace trellis::templating {

std::string DirectoryTemplateLoader::LoadTemplateHtml(std::string_view name) const {
  auto path = directory_ / std::string(name);
  spdlog::trace("Loading template {}", path.string());
  auto html = utils::ReadText(path);
  if (!html) throw MissingTemplateException("Couldn't read template '{}' from {}", name, path.string());
  return std::move(*html);
}

std::string MemoryTemplateLoader::LoadTemplateHtml(std::string_view name) const {
  auto it = templates_.find(name);
  if (it == templates_.end()) throw MissingTemplateException("There is no template named '{}'", name);
  return it->second;
}

}  // namespace trellis::templating
