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

#include <filesystem>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

#include "utils/file.hpp"

namespace fs = std::filesystem;

class UtilsFileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    Clear();
    fs::create_directory(storage);
  }

  void TearDown() override { Clear(); }

  const fs::path storage{fs::temp_directory_path() / "trellis_test_utils_file"};

 private:
  void Clear() {
    if (fs::exists(storage)) fs::remove_all(storage);
  }
};

TEST_F(UtilsFileTest, ReadText) {
  {
    std::ofstream stream(storage / "page.html");
    stream << "<main>\n  Hello\n</main>\n";
  }
  auto text = trellis::utils::ReadText(storage / "page.html");
  ASSERT_TRUE(text);
  EXPECT_EQ(*text, "<main>\n  Hello\n</main>\n");
}

TEST_F(UtilsFileTest, ReadTextMissing) {
  EXPECT_FALSE(trellis::utils::ReadText(storage / "missing.html"));
  // Directories can't be read as text.
  EXPECT_FALSE(trellis::utils::ReadText(storage));
}

TEST_F(UtilsFileTest, WriteText) {
  ASSERT_TRUE(trellis::utils::WriteText(storage / "out.html", "first"));
  ASSERT_TRUE(trellis::utils::WriteText(storage / "out.html", "<p>second</p>"));
  EXPECT_EQ(trellis::utils::ReadText(storage / "out.html"), "<p>second</p>");
  EXPECT_FALSE(trellis::utils::WriteText(storage / "no_such_dir" / "out.html", "x"));
}

TEST_F(UtilsFileTest, DirExists) {
  EXPECT_TRUE(trellis::utils::DirExists(storage));
  EXPECT_FALSE(trellis::utils::DirExists(storage / "missing"));
  {
    std::ofstream stream(storage / "file");
  }
  EXPECT_FALSE(trellis::utils::DirExists(storage / "file"));
  EXPECT_TRUE(trellis::utils::HasReadAccess(storage / "file"));
}
