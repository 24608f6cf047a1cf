//===- Scanner.h - Find mutable functions in a Rust tree --------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The scanner walks the items of each source file (modules, impls, traits and
// free functions) and records every function whose body can be replaced by a
// value of its return type. It does not look inside function bodies.
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_SOURCE_SCANNER_H
#define MUTANTS_SOURCE_SCANNER_H

#include "mutants/Support/MutantsConfig.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace mutants {

/// A function body that can be mutated.
struct FunctionSite {
  /// Path relative to the subject root, with '/' separators.
  std::string file;
  /// Qualified name, e.g. "parser::Lexer::next". Built from the file's
  /// module path, enclosing inline modules and the impl or trait type.
  std::string functionName;
  /// Declared return type with normalized spacing; empty for unit.
  std::string returnType;
  /// Byte offsets of the opening '{' and one past the closing '}'.
  size_t bodyStart = 0;
  size_t bodyEnd = 0;
  /// 1-based location of the opening '{'.
  unsigned line = 0;
  unsigned column = 0;
};

/// Everything learned from one file.
struct FileScan {
  std::vector<FunctionSite> sites;
  /// Candidate paths of every out-of-line `mod name;` the file declares.
  std::vector<std::string> childFiles;
  /// Candidate paths of out-of-line modules carrying a skip attribute.
  std::vector<std::string> skippedFiles;
  /// The whole file is skipped by an inner attribute such as #![cfg(test)].
  bool fileSkipped = false;
};

class Scanner {
public:
  explicit Scanner(ScanConfig config) : config(std::move(config)) {}

  /// Return the root-relative paths of all .rs files under the configured
  /// source directories that pass the include/exclude globs, sorted.
  llvm::Expected<std::vector<std::string>>
  discoverFiles(llvm::StringRef root) const;

  /// Parse \p text, the contents of root-relative file \p relPath.
  llvm::Expected<FileScan> scanFile(llvm::StringRef relPath,
                                    llvm::StringRef text) const;

  /// Return true if \p text carries a generated-code marker in its first
  /// lines.
  bool isGenerated(llvm::StringRef text) const;

  /// Return true if attribute text (the part between #[ and ]) names one of
  /// the configured skip attributes.
  bool isSkipAttribute(llvm::StringRef attribute) const;

  /// Return true if \p relPath passes the include/exclude file globs.
  bool isFileSelected(llvm::StringRef relPath) const;

  /// Derive the module path of a file: "src/lib.rs" -> "",
  /// "src/a/mod.rs" -> "a", "src/a/b.rs" -> "a::b".
  static std::string
  getModulePathForFile(llvm::StringRef relPath,
                       llvm::ArrayRef<std::string> sourceDirs);

private:
  ScanConfig config;
};

} // namespace mutants

#endif // MUTANTS_SOURCE_SCANNER_H
