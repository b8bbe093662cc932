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

#include "utils/file.hpp"

#include <unistd.h>

#include <fstream>
#include <sstream>

namespace trellis::utils {

std::optional<std::string> ReadText(const std::filesystem::path &path) noexcept {
  std::error_code error_code;  // For exception suppression.
  if (!std::filesystem::is_regular_file(path, error_code)) return std::nullopt;

  std::ifstream stream(path, std::ios::in | std::ios::binary);
  if (!stream.is_open()) return std::nullopt;

  std::ostringstream contents;
  contents << stream.rdbuf();
  if (stream.bad()) return std::nullopt;
  return std::move(contents).str();
}

bool WriteText(const std::filesystem::path &path, std::string_view text) noexcept {
  std::ofstream stream(path, std::ios::out | std::ios::binary | std::ios::trunc);
  if (!stream.is_open()) return false;
  stream.write(text.data(), static_cast<std::streamsize>(text.size()));
  stream.flush();
  return stream.good();
}

bool DirExists(const std::filesystem::path &dir) {
  std::error_code error_code;  // For exception suppression.
  return std::filesystem::is_directory(dir, error_code);
}

bool HasReadAccess(const std::filesystem::path &path) { return access(path.c_str(), R_OK) == 0; }

}  // namespace trellis::utils
