//===- Generator.h - Enumerate the mutations of a tree ----------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The generator drives the scanner over a subject tree and turns every
// function site into one mutation per candidate replacement value. The
// result is ordered by file, body offset and candidate index, so a rerun over
// an unchanged tree yields the same sequence.
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_MUTATION_GENERATOR_H
#define MUTANTS_MUTATION_GENERATOR_H

#include "mutants/Mutation/Mutation.h"
#include "mutants/Support/Diagnostics.h"
#include "mutants/Support/MutantsConfig.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <string>
#include <vector>

namespace mutants {

/// Return the replacement values for a function returning \p returnType, in
/// a fixed order. An empty type means unit.
std::vector<std::string>
getReplacementsForReturnType(llvm::StringRef returnType);

/// A file that could not be scanned. Its diagnostic refers to the file by
/// root-relative path; the text is kept so the diagnostic can quote it.
struct ScanProblem {
  std::string file;
  std::string sourceText;
  RichDiagnostic diagnostic;
};

/// Everything found in a subject tree.
struct Discovery {
  /// Root-relative paths of every discovered source file, sorted.
  std::vector<std::string> files;
  std::vector<Mutation> mutations;
  std::vector<ScanProblem> problems;
  /// One line per problem, for the end-of-run summary.
  std::vector<std::string> warnings;
};

/// Build the mutations for the sites of one scanned file.
std::vector<Mutation> generateMutations(const FileScan &scan);

/// Scan every selected file under \p root and enumerate its mutations.
/// Files that fail to scan are reported in Discovery::problems; only errors
/// that prevent listing the tree are returned.
llvm::Expected<Discovery> discoverMutations(llvm::StringRef root,
                                            const MutantsConfig &config);

} // namespace mutants

#endif // MUTANTS_MUTATION_GENERATOR_H
