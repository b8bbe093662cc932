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

/**
 * @file
 *
 * This file contains utilities for operations with files.
 */
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace trellis::utils {

/// Reads the whole file specified by path. If the file doesn't exist, isn't a
/// regular file or there is an access error the function returns nullopt.
std::optional<std::string> ReadText(const std::filesystem::path &path) noexcept;

/// Writes `text` to the file specified by path, truncating it first.
/// Returns false if the file couldn't be opened or written.
bool WriteText(const std::filesystem::path &path, std::string_view text) noexcept;

/// Returns a boolean indicating whether the directory exists.
bool DirExists(const std::filesystem::path &dir);

/// Checks if process has read access to the file.
bool HasReadAccess(const std::filesystem::path &path);

}  // namespace trellis::utils
