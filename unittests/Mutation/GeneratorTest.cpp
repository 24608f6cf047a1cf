//===- GeneratorTest.cpp - Unit tests for mutation discovery --------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutants/Mutation/Generator.h"
#include "mutants/Support/MutantsError.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"
#include "gtest/gtest.h"

using namespace mutants;

namespace {

using Values = std::vector<std::string>;

//===----------------------------------------------------------------------===//
// Replacement catalogue
//===----------------------------------------------------------------------===//

TEST(GeneratorTest, ReplacementCatalogue) {
  EXPECT_EQ(getReplacementsForReturnType(""), Values{"()"});
  EXPECT_EQ(getReplacementsForReturnType("bool"), (Values{"true", "false"}));
  EXPECT_EQ(getReplacementsForReturnType("String"),
            (Values{"String::new()", "\"xyzzy\".into()"}));
  EXPECT_EQ(getReplacementsForReturnType("&str"),
            (Values{"\"\"", "\"xyzzy\""}));
  EXPECT_EQ(getReplacementsForReturnType("&'static str"),
            (Values{"\"\"", "\"xyzzy\""}));
  EXPECT_EQ(getReplacementsForReturnType("usize"), (Values{"0", "1"}));
  EXPECT_EQ(getReplacementsForReturnType("i64"), (Values{"0", "1", "-1"}));
  EXPECT_EQ(getReplacementsForReturnType("f32"),
            (Values{"0.0", "1.0", "-1.0"}));
  EXPECT_EQ(getReplacementsForReturnType("Result<(), String>"),
            Values{"Ok(())"});
  EXPECT_EQ(getReplacementsForReturnType("std::io::Result<()>"),
            Values{"Ok(())"});
  EXPECT_EQ(getReplacementsForReturnType("Result<Vec<u8>, Error>"),
            Values{"Ok(Default::default())"});
  EXPECT_EQ(getReplacementsForReturnType("std::fmt::Result"),
            Values{"Ok(Default::default())"});
  EXPECT_EQ(getReplacementsForReturnType("Option<&str>"),
            (Values{"None", "Some(Default::default())"}));
  EXPECT_EQ(getReplacementsForReturnType("Vec<u8>"),
            (Values{"vec![]", "vec![Default::default()]"}));
  EXPECT_EQ(getReplacementsForReturnType("Box<Node>"),
            Values{"Box::new(Default::default())"});
  EXPECT_EQ(getReplacementsForReturnType("&mut str"),
            Values{"Default::default()"});
  EXPECT_EQ(getReplacementsForReturnType("HashMap<String, u32>"),
            Values{"Default::default()"});
}

TEST(GeneratorTest, MutationsFollowSitesAndCandidates) {
  FileScan scan;
  FunctionSite first;
  first.file = "src/lib.rs";
  first.functionName = "first";
  first.returnType = "bool";
  first.bodyStart = 10;
  first.bodyEnd = 20;
  first.line = 1;
  first.column = 11;
  FunctionSite second = first;
  second.functionName = "second";
  second.returnType = "";
  second.bodyStart = 30;
  second.bodyEnd = 40;
  second.line = 2;
  scan.sites = {first, second};

  std::vector<Mutation> mutations = generateMutations(scan);
  ASSERT_EQ(mutations.size(), 3u);
  EXPECT_EQ(mutations[0].getReplacement(), "true");
  EXPECT_EQ(mutations[1].getReplacement(), "false");
  EXPECT_EQ(mutations[2].getName(), "src/lib.rs:2:11: replace second with ()");
}

//===----------------------------------------------------------------------===//
// Discovery
//===----------------------------------------------------------------------===//

class GeneratorDiscoveryTest : public ::testing::Test {
protected:
  void SetUp() override {
    ASSERT_FALSE(llvm::sys::fs::createUniqueDirectory("mutants-gen", root));
    writeFile("src/lib.rs", "mod a;\n"
                            "#[cfg(test)]\n"
                            "mod tests;\n"
                            "pub fn half(x: i64) -> i64 { x / 2 }\n");
    writeFile("src/a.rs", "pub fn yes() -> bool { true }\n");
    writeFile("src/tests.rs", "mod helpers;\nfn t() -> u8 { 1 }\n");
    writeFile("src/tests/helpers.rs", "fn h() -> u8 { 1 }\n");
    writeFile("src/broken.rs", "fn f() { \"open\n");
    writeFile("src/gen.rs", "// @generated\nfn g() -> u8 { 1 }\n");
  }
  void TearDown() override { llvm::sys::fs::remove_directories(root); }

  void writeFile(llvm::StringRef rel, llvm::StringRef contents) {
    llvm::SmallString<128> path(root);
    llvm::sys::path::append(path, rel);
    ASSERT_FALSE(
        llvm::sys::fs::create_directories(llvm::sys::path::parent_path(path)));
    std::error_code ec;
    llvm::raw_fd_ostream os(path, ec);
    ASSERT_FALSE(ec);
    os << contents;
  }

  static std::vector<std::string> names(const Discovery &discovery) {
    std::vector<std::string> out;
    for (const Mutation &mutation : discovery.mutations)
      out.push_back(mutation.getName());
    return out;
  }

  llvm::SmallString<128> root;
};

TEST_F(GeneratorDiscoveryTest, DiscoversTree) {
  MutantsConfig config;
  auto discovery = discoverMutations(root, config);
  ASSERT_TRUE(static_cast<bool>(discovery))
      << llvm::toString(discovery.takeError());

  EXPECT_EQ(discovery->files,
            (Values{"src/a.rs", "src/broken.rs", "src/gen.rs", "src/lib.rs",
                    "src/tests.rs", "src/tests/helpers.rs"}));
  EXPECT_EQ(names(*discovery),
            (Values{"src/a.rs:1:22: replace a::yes -> bool with true",
                    "src/a.rs:1:22: replace a::yes -> bool with false",
                    "src/lib.rs:4:28: replace half -> i64 with 0",
                    "src/lib.rs:4:28: replace half -> i64 with 1",
                    "src/lib.rs:4:28: replace half -> i64 with -1"}));

  ASSERT_EQ(discovery->problems.size(), 1u);
  EXPECT_EQ(discovery->problems[0].file, "src/broken.rs");
  EXPECT_EQ(discovery->problems[0].diagnostic.getSeverity(),
            DiagSeverity::Warning);
  ASSERT_EQ(discovery->warnings.size(), 1u);
  EXPECT_EQ(discovery->warnings[0],
            "src/broken.rs:1:10: unterminated string literal");
}

TEST_F(GeneratorDiscoveryTest, IsDeterministic) {
  MutantsConfig config;
  auto first = discoverMutations(root, config);
  auto second = discoverMutations(root, config);
  ASSERT_TRUE(static_cast<bool>(first));
  ASSERT_TRUE(static_cast<bool>(second));
  EXPECT_EQ(names(*first), names(*second));
}

TEST_F(GeneratorDiscoveryTest, FunctionFilters) {
  MutantsConfig config;
  config.getScan().excludeFunctions.push_back("half");
  auto excluded = discoverMutations(root, config);
  ASSERT_TRUE(static_cast<bool>(excluded));
  EXPECT_EQ(excluded->mutations.size(), 2u);

  MutantsConfig only;
  only.getScan().includeFunctions.push_back("with -1$");
  auto included = discoverMutations(root, only);
  ASSERT_TRUE(static_cast<bool>(included));
  ASSERT_EQ(included->mutations.size(), 1u);
  EXPECT_EQ(included->mutations[0].getFunctionName(), "half");
}

TEST_F(GeneratorDiscoveryTest, InvalidRegexIsConfigError) {
  MutantsConfig config;
  config.getScan().includeFunctions.push_back("(");
  auto discovery = discoverMutations(root, config);
  ASSERT_FALSE(static_cast<bool>(discovery));
  std::string message;
  EXPECT_EQ(takeErrorKind(discovery.takeError(), message), ErrorKind::Config);
}

TEST_F(GeneratorDiscoveryTest, EmptyTree) {
  llvm::sys::fs::remove_directories(root);
  ASSERT_FALSE(llvm::sys::fs::create_directories(root));
  MutantsConfig config;
  auto discovery = discoverMutations(root, config);
  ASSERT_TRUE(static_cast<bool>(discovery));
  EXPECT_TRUE(discovery->files.empty());
  EXPECT_TRUE(discovery->mutations.empty());
}

} // namespace
