// Repository: Clipper
// Component: Atomic file publication unit tests
// Copyright (c) 2026 Clipper

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "clipper/util/AtomicFile.hpp"
#include "TempDir.hpp"

namespace clipper::util {
namespace {

namespace fs = std::filesystem;

std::string Slurp(const std::string& path) {
  std::ifstream in(path);
  std::stringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

// -----------------------------------------------------------------------------
// Replace keeps no temp file behind
// -----------------------------------------------------------------------------
TEST(AtomicFileTest, WriteReplacesWholeFile) {
  clipper::testing::TempDir dir("atomic");
  const std::string path = dir.Path("state.json");
  std::string error;
  ASSERT_TRUE(WriteFileAtomically(path, "first version, longer", &error)) << error;
  ASSERT_TRUE(WriteFileAtomically(path, "second", &error)) << error;
  EXPECT_EQ(Slurp(path), "second");

  size_t files = 0;
  for (const auto& de : fs::directory_iterator(dir.root())) {
    (void)de;
    ++files;
  }
  EXPECT_EQ(files, 1u);
}

TEST(AtomicFileTest, MissingDirectoryFails) {
  std::string error;
  EXPECT_FALSE(WriteFileAtomically("/nonexistent/clipper/state.json", "x", &error));
  EXPECT_NE(error.find("cannot open"), std::string::npos) << error;
}

// -----------------------------------------------------------------------------
// Publish removes the temp file when the rename fails
// -----------------------------------------------------------------------------
TEST(AtomicFileTest, FailedPublishRemovesTemp) {
  clipper::testing::TempDir dir("atomic_publish");
  const std::string tmp = dir.WriteFile("clip.part", "data");
  fs::create_directories(dir.Path("clip.mp4"));
  std::string error;
  EXPECT_FALSE(PublishFile(tmp, dir.Path("clip.mp4"), &error));
  EXPECT_FALSE(error.empty());
  EXPECT_FALSE(fs::exists(tmp));
}

TEST(AtomicFileTest, EnsureDirectoryCreatesNestedPath) {
  clipper::testing::TempDir dir("atomic_dirs");
  std::string error;
  ASSERT_TRUE(EnsureDirectory(dir.Path("a/b/c"), &error)) << error;
  EXPECT_TRUE(fs::is_directory(dir.Path("a/b/c")));
  EXPECT_TRUE(EnsureDirectory(dir.Path("a/b/c"), &error)) << "idempotent";

  const std::string file = dir.WriteFile("plain", "x");
  EXPECT_FALSE(EnsureDirectory(file, &error));
}

}  // namespace
}  // namespace clipper::util
