//===- BuildDirTest.cpp - Unit tests for scratch copies -------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "LabTestUtils.h"
#include "mutants/Lab/BuildDir.h"
#include "mutants/Support/MutantsError.h"
#include "gtest/gtest.h"

using namespace mutants;
using namespace mutants::test;
namespace fs = llvm::sys::fs;

namespace {

class BuildDirTest : public ::testing::Test {
protected:
  void SetUp() override {
    tree.write("Cargo.toml", "[package]\nname = \"subject\"\n");
    tree.write("src/lib.rs", kHalfSource);
    tree.write("src/nested/target/keep.rs", "// not a build directory\n");
    tree.write("target/debug/big.rlib", "artifact");
    tree.write(".git/HEAD", "ref: refs/heads/main\n");
  }

  std::string inCopy(const BuildDir &dir, llvm::StringRef rel) {
    llvm::SmallString<128> path(dir.getPath());
    llvm::sys::path::append(path, rel);
    return path.str().str();
  }

  TempTree tree;
};

TEST_F(BuildDirTest, CopiesTreeWithoutExcludedDirectories) {
  auto dir = BuildDir::prepare(tree.getPath(), CopyConfig());
  ASSERT_TRUE(static_cast<bool>(dir)) << llvm::toString(dir.takeError());
  BuildDir &copy = **dir;

  EXPECT_NE(copy.getPath(), tree.getPath());
  EXPECT_EQ(TempTree::readFile(inCopy(copy, "src/lib.rs")), kHalfSource);
  EXPECT_TRUE(fs::exists(inCopy(copy, "Cargo.toml")));
  EXPECT_FALSE(fs::exists(inCopy(copy, "target")));
  EXPECT_FALSE(fs::exists(inCopy(copy, ".git")));
  // Excluded names match directories at any depth.
  EXPECT_FALSE(fs::exists(inCopy(copy, "src/nested/target")));
  EXPECT_TRUE(fs::exists(inCopy(copy, "src/nested")));

  uint64_t expected = llvm::StringRef(kHalfSource).size() +
                      llvm::StringRef("[package]\nname = \"subject\"\n").size();
  EXPECT_EQ(copy.getBytesCopied(), expected);
}

TEST_F(BuildDirTest, CustomExcludes) {
  CopyConfig config;
  config.exclude = {"src"};
  auto dir = BuildDir::prepare(tree.getPath(), config);
  ASSERT_TRUE(static_cast<bool>(dir)) << llvm::toString(dir.takeError());
  EXPECT_FALSE(fs::exists(inCopy(**dir, "src")));
  EXPECT_TRUE(fs::exists(inCopy(**dir, "target/debug/big.rlib")));
}

TEST_F(BuildDirTest, RecreatesSymlinks) {
  ASSERT_FALSE(fs::create_link("lib.rs", tree.getPath("src/alias.rs")));
  auto dir = BuildDir::prepare(tree.getPath(), CopyConfig());
  ASSERT_TRUE(static_cast<bool>(dir)) << llvm::toString(dir.takeError());

  llvm::SmallString<128> target;
  ASSERT_FALSE(fs::real_path(inCopy(**dir, "src/alias.rs"), target));
  llvm::SmallString<128> expected;
  ASSERT_FALSE(fs::real_path(inCopy(**dir, "src/lib.rs"), expected));
  EXPECT_EQ(target, expected);
}

TEST_F(BuildDirTest, RemovedOnDestruction) {
  std::string path;
  {
    auto dir = BuildDir::prepare(tree.getPath(), CopyConfig());
    ASSERT_TRUE(static_cast<bool>(dir)) << llvm::toString(dir.takeError());
    path = (*dir)->getPath().str();
    EXPECT_TRUE(fs::is_directory(path));
  }
  EXPECT_FALSE(fs::exists(path));
}

TEST_F(BuildDirTest, LeaveCopy) {
  std::string path;
  {
    auto dir = BuildDir::prepare(tree.getPath(), CopyConfig(),
                                 /*leaveCopy=*/true);
    ASSERT_TRUE(static_cast<bool>(dir)) << llvm::toString(dir.takeError());
    path = (*dir)->getPath().str();
  }
  EXPECT_TRUE(fs::is_directory(path));
  fs::remove_directories(path);
}

TEST_F(BuildDirTest, ApplyAndReset) {
  auto dir = BuildDir::prepare(tree.getPath(), CopyConfig());
  ASSERT_TRUE(static_cast<bool>(dir)) << llvm::toString(dir.takeError());
  BuildDir &copy = **dir;
  Mutation mutation = makeHalfMutation();

  ASSERT_FALSE(static_cast<bool>(copy.apply(mutation)));
  EXPECT_TRUE(copy.hasMutation());
  EXPECT_EQ(copy.getOriginalText(), kHalfSource);
  EXPECT_EQ(TempTree::readFile(inCopy(copy, "src/lib.rs")),
            "pub fn half(x: i64) -> i64 { 0 /* ~ changed by mutants ~ */ }\n");
  // The subject tree itself is never touched.
  EXPECT_EQ(tree.read("src/lib.rs"), kHalfSource);

  ASSERT_FALSE(static_cast<bool>(copy.reset()));
  EXPECT_FALSE(copy.hasMutation());
  EXPECT_EQ(TempTree::readFile(inCopy(copy, "src/lib.rs")), kHalfSource);

  // Resetting a clean copy does nothing.
  EXPECT_FALSE(static_cast<bool>(copy.reset()));
}

TEST_F(BuildDirTest, OneMutationAtATime) {
  auto dir = BuildDir::prepare(tree.getPath(), CopyConfig());
  ASSERT_TRUE(static_cast<bool>(dir)) << llvm::toString(dir.takeError());
  BuildDir &copy = **dir;

  ASSERT_FALSE(static_cast<bool>(copy.apply(makeHalfMutation("1"))));
  llvm::Error err = copy.apply(makeHalfMutation("-1"));
  ASSERT_TRUE(static_cast<bool>(err));
  std::string message;
  EXPECT_EQ(takeErrorKind(std::move(err), message), ErrorKind::Isolation);
  EXPECT_EQ(TempTree::readFile(inCopy(copy, "src/lib.rs")),
            "pub fn half(x: i64) -> i64 { 1 /* ~ changed by mutants ~ */ }\n");
  EXPECT_FALSE(static_cast<bool>(copy.reset()));
}

TEST_F(BuildDirTest, StaleMutationIsIsolationError) {
  auto dir = BuildDir::prepare(tree.getPath(), CopyConfig());
  ASSERT_TRUE(static_cast<bool>(dir)) << llvm::toString(dir.takeError());
  std::string rewritten = inCopy(**dir, "src/lib.rs");
  {
    std::error_code ec;
    llvm::raw_fd_ostream os(rewritten, ec);
    ASSERT_FALSE(ec);
    os << "pub fn other() {}\n";
  }

  llvm::Error err = (*dir)->apply(makeHalfMutation());
  ASSERT_TRUE(static_cast<bool>(err));
  std::string message;
  EXPECT_EQ(takeErrorKind(std::move(err), message), ErrorKind::Isolation);
  EXPECT_FALSE((*dir)->hasMutation());
}

TEST_F(BuildDirTest, MissingSourceIsIsolationError) {
  auto dir = BuildDir::prepare(tree.getPath("no-such-dir"), CopyConfig());
  ASSERT_FALSE(static_cast<bool>(dir));
  std::string message;
  EXPECT_EQ(takeErrorKind(dir.takeError(), message), ErrorKind::Isolation);
}

} // namespace
