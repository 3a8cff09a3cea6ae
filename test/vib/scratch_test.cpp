//
// Project VibraKit - Copyright 2025 SNU Compbio Lab.
// SPDX-License-Identifier: Apache-2.0
//

#include "vibra/vib/scratch.h"

#include <filesystem>
#include <fstream>
#include <optional>
#include <utility>

#include <absl/status/statusor.h>

#include <gtest/gtest.h>

#include "vibra/status.h"

namespace vibra {
namespace {
namespace fs = std::filesystem;

class ScratchDirectoryTest: public ::testing::Test {
protected:
  void SetUp() override {
    root_ = fs::path(::testing::TempDir()) / "vibra_scratch_test"
            / ::testing::UnitTest::GetInstance()->current_test_info()->name();
    fs::remove_all(root_);
  }

  void TearDown() override { fs::remove_all(root_); }

  fs::path root_;
};

TEST_F(ScratchDirectoryTest, CreateAndRemove) {
  fs::path path;
  {
    absl::StatusOr<ScratchDirectory> dir = ScratchDirectory::create(root_, "a");
    ASSERT_TRUE(dir.ok()) << dir.status();
    path = dir->path();
    EXPECT_EQ(path.string(), (root_ / "a").string());
    EXPECT_TRUE(fs::is_directory(path));
  }
  EXPECT_FALSE(fs::exists(path));
  EXPECT_TRUE(fs::exists(root_));
}

TEST_F(ScratchDirectoryTest, ReuseExisting) {
  fs::create_directories(root_ / "b");
  std::ofstream(root_ / "b" / "record") << "energy 1\n";

  absl::StatusOr<ScratchDirectory> dir = ScratchDirectory::create(root_, "b");
  ASSERT_TRUE(dir.ok()) << dir.status();
  EXPECT_TRUE(fs::exists(dir->path() / "record"));
}

TEST_F(ScratchDirectoryTest, InvalidNames) {
  for (const char *name: { "", ".", "..", "a/b" }) {
    absl::StatusOr<ScratchDirectory> dir = ScratchDirectory::create(root_, name);
    EXPECT_TRUE(is_invalid_input(dir.status())) << name;
  }
}

TEST_F(ScratchDirectoryTest, ClearKeepsDirectory) {
  absl::StatusOr<ScratchDirectory> dir = ScratchDirectory::create(root_, "c");
  ASSERT_TRUE(dir.ok()) << dir.status();

  std::ofstream(dir->path() / "x") << "x\n";
  fs::create_directories(dir->path() / "sub" / "dir");

  ASSERT_TRUE(dir->clear().ok());
  EXPECT_TRUE(fs::is_directory(dir->path()));
  EXPECT_TRUE(fs::is_empty(dir->path()));
}

TEST_F(ScratchDirectoryTest, MoveTransfersOwnership) {
  std::optional<ScratchDirectory> owner;
  {
    absl::StatusOr<ScratchDirectory> dir = ScratchDirectory::create(root_, "d");
    ASSERT_TRUE(dir.ok()) << dir.status();
    owner.emplace(*std::move(dir));
  }
  EXPECT_TRUE(fs::is_directory(root_ / "d"));

  owner.reset();
  EXPECT_FALSE(fs::exists(root_ / "d"));
}
}  // namespace
}  // namespace vibra
