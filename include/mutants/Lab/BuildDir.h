//===- BuildDir.h - Private scratch copies of the subject tree --*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Each worker owns one BuildDir for its lifetime. Mutations are applied to
// the copy one at a time and reverted before the next scenario, so build
// artifacts in the copy are reused between mutants.
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_LAB_BUILDDIR_H
#define MUTANTS_LAB_BUILDDIR_H

#include "mutants/Mutation/Mutation.h"
#include "mutants/Support/MutantsConfig.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace mutants {

class BuildDir {
public:
  /// Copy \p sourceRoot into a fresh directory under the system temporary
  /// directory, skipping directories named in \p copy. Failures are
  /// Isolation errors.
  static llvm::Expected<std::unique_ptr<BuildDir>>
  prepare(llvm::StringRef sourceRoot, const CopyConfig &copy,
          bool leaveCopy = false);

  /// Removes the copy unless it is to be left behind.
  ~BuildDir();

  BuildDir(const BuildDir &) = delete;
  BuildDir &operator=(const BuildDir &) = delete;

  llvm::StringRef getPath() const { return path; }
  uint64_t getBytesCopied() const { return bytesCopied; }

  /// Apply \p mutation to the copy. At most one mutation may be applied at a
  /// time.
  llvm::Error apply(const Mutation &mutation);

  /// Restore the file changed by the last apply(). Does nothing if no
  /// mutation is applied.
  llvm::Error reset();

  bool hasMutation() const { return applied.has_value(); }

  /// The unmutated text of the file changed by the applied mutation.
  llvm::StringRef getOriginalText() const {
    return applied ? llvm::StringRef(applied->originalText) : "";
  }

private:
  BuildDir(std::string path, bool leaveCopy)
      : path(std::move(path)), leaveCopy(leaveCopy) {}

  struct AppliedMutation {
    std::string file;
    std::string originalText;
  };

  std::string path;
  bool leaveCopy;
  uint64_t bytesCopied = 0;
  std::optional<AppliedMutation> applied;
};

} // namespace mutants

#endif // MUTANTS_LAB_BUILDDIR_H
