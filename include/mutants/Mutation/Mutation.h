//===- Mutation.h - A single source replacement -----------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A Mutation replaces the body of one function with a fixed value of its
// return type. Mutations are immutable values; they are created by the
// generator and shared read-only by every worker.
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_MUTATION_MUTATION_H
#define MUTANTS_MUTATION_MUTATION_H

#include "mutants/Source/Scanner.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <string>

namespace mutants {

/// Marker placed in every replacement body so that mutated code is easy to
/// recognize in logs and diffs.
constexpr llvm::StringLiteral kMutationMarker = "/* ~ changed by mutants ~ */";

class Mutation {
public:
  Mutation(const FunctionSite &site, llvm::StringRef replacement)
      : site(site), replacement(replacement.str()) {}

  llvm::StringRef getFile() const { return site.file; }
  llvm::StringRef getFunctionName() const { return site.functionName; }
  llvm::StringRef getReturnType() const { return site.returnType; }
  /// The value that replaces the body, e.g. "0" or "String::new()".
  llvm::StringRef getReplacement() const { return replacement; }
  size_t getSpanStart() const { return site.bodyStart; }
  size_t getSpanEnd() const { return site.bodyEnd; }
  unsigned getLine() const { return site.line; }
  unsigned getColumn() const { return site.column; }

  /// "src/lib.rs:1:24"
  std::string getLocation() const;

  /// "replace half -> i64 with 0", or "replace log with ()" for unit
  /// functions.
  std::string describeChange() const;

  /// Location and change: "src/lib.rs:1:24: replace half -> i64 with 0".
  std::string getName() const;

  /// The text written over the body span, braces included.
  std::string getReplacementText() const;

  /// Return \p original with the body span replaced. Fails if the span does
  /// not cover a brace-delimited body in \p original.
  llvm::Expected<std::string> applyTo(llvm::StringRef original) const;

  /// Rewrite the mutated file inside the tree rooted at \p treeRoot.
  llvm::Error applyInTree(llvm::StringRef treeRoot) const;

  /// Return a unified diff of the change against \p original with three
  /// lines of context.
  std::string getUnifiedDiff(llvm::StringRef original) const;

  /// The entry written to mutants.json and printed by --list --json.
  llvm::json::Object toJSON() const;

private:
  FunctionSite site;
  std::string replacement;
};

} // namespace mutants

#endif // MUTANTS_MUTATION_MUTATION_H
