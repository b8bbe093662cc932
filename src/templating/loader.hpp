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

#include <filesystem>
#include <map>
#include <string>
#include <string_view>

namespace trellis::templating {

/// Maps template names to their raw markup. Implementations are read-only
/// after construction so one loader can serve many renders.
class TemplateLoader {
 public:
  TemplateLoader() = default;
  TemplateLoader(const TemplateLoader &) = delete;
  TemplateLoader &operator=(const TemplateLoader &) = delete;
  TemplateLoader(TemplateLoader &&) = delete;
  TemplateLoader &operator=(TemplateLoader &&) = delete;
  virtual ~TemplateLoader() = default;

  /// @throw MissingTemplateException if there is no template called `name`.
  virtual std::string LoadTemplateHtml(std::string_view name) const = 0;
};

/// Reads `<directory>/<name>`.
class DirectoryTemplateLoader final : public TemplateLoader {
 public:
  explicit DirectoryTemplateLoader(std::filesystem::path directory) : directory_(std::move(directory)) {}

  const std::filesystem::path &directory() const { return directory_; }

  std::string LoadTemplateHtml(std::string_view name) const override;

 private:
  std::filesystem::path directory_;
};

/// Serves templates from memory.
class MemoryTemplateLoader final : public TemplateLoader {
 public:
  MemoryTemplateLoader() = default;
  explicit MemoryTemplateLoader(std::map<std::string, std::string, std::less<>> templates)
      : templates_(std::move(templates)) {}

  void Add(std::string name, std::string html) { templates_.insert_or_assign(std::move(name), std::move(html)); }

  std::string LoadTemplateHtml(std::string_view name) const override;

 private:
  std::map<std::string, std::string, std::less<>> templates_;
};

}  // namespace trellis::templating
