//===- LabTestUtils.h - Helpers for Lab unit tests --------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_UNITTESTS_LAB_LABTESTUTILS_H
#define MUTANTS_UNITTESTS_LAB_LABTESTUTILS_H

#include "mutants/Mutation/Mutation.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"
#include "gtest/gtest.h"

#include <string>
#include <vector>

namespace mutants {
namespace test {

/// A temporary directory that is removed when the object is destroyed.
class TempTree {
public:
  explicit TempTree(llvm::StringRef prefix = "mutants-test") {
    EXPECT_FALSE(llvm::sys::fs::createUniqueDirectory(prefix, root));
  }
  ~TempTree() { llvm::sys::fs::remove_directories(root); }

  llvm::StringRef getPath() const { return root; }

  std::string getPath(llvm::StringRef rel) const {
    llvm::SmallString<128> path(root);
    llvm::sys::path::append(path, rel);
    return path.str().str();
  }

  void write(llvm::StringRef rel, llvm::StringRef contents) const {
    std::string path = getPath(rel);
    ASSERT_FALSE(
        llvm::sys::fs::create_directories(llvm::sys::path::parent_path(path)));
    std::error_code ec;
    llvm::raw_fd_ostream os(path, ec);
    ASSERT_FALSE(ec) << ec.message();
    os << contents;
  }

  /// Return the contents of \p rel, or "<missing>".
  std::string read(llvm::StringRef rel) const { return readFile(getPath(rel)); }

  static std::string readFile(llvm::StringRef path) {
    auto buffer = llvm::MemoryBuffer::getFile(path);
    if (!buffer)
      return "<missing>";
    return (*buffer)->getBuffer().str();
  }

private:
  llvm::SmallString<128> root;
};

/// A command that runs \p script with /bin/sh.
inline std::vector<std::string> shell(llvm::StringRef script) {
  return {"/bin/sh", "-c", script.str()};
}

/// A mutation replacing the body of `fn half(x: i64) -> i64 { x / 2 }` on
/// the first line of src/lib.rs.
inline Mutation makeHalfMutation(llvm::StringRef replacement = "0") {
  FunctionSite site;
  site.file = "src/lib.rs";
  site.functionName = "half";
  site.returnType = "i64";
  site.bodyStart = 27;
  site.bodyEnd = 36;
  site.line = 1;
  site.column = 28;
  return Mutation(site, replacement);
}

/// The source text makeHalfMutation() applies to.
constexpr const char *kHalfSource = "pub fn half(x: i64) -> i64 { x / 2 }\n";

} // namespace test
} // namespace mutants

#endif // MUTANTS_UNITTESTS_LAB_LABTESTUTILS_H
