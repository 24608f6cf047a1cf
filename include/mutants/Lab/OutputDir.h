//===- OutputDir.h - The mutants.out result directory -----------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Layout:
//
//   mutants.out/
//     log/source_tree.log
//     log/baseline.log
//     log/0001-src__lib.rs_4_28.log
//     mutants.json        all mutations considered by the run
//     outcomes.json       all outcomes and the summary counts
//     caught.txt          one mutation name per line, per status
//     missed.txt
//     timeout.txt
//     unviable.txt
//
// The directory of a previous run is kept as mutants.out.old.
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_LAB_OUTPUTDIR_H
#define MUTANTS_LAB_OUTPUTDIR_H

#include "mutants/Lab/Outcome.h"
#include "mutants/Mutation/Mutation.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <memory>
#include <string>

namespace mutants {

class OutputDir {
public:
  /// Create \p parent/mutants.out and its log directory, first moving any
  /// existing mutants.out to mutants.out.old.
  static llvm::Expected<std::unique_ptr<OutputDir>>
  create(llvm::StringRef parent);

  llvm::StringRef getPath() const { return path; }
  std::string getLogDirectory() const;

  /// Return the log file for \p scenario.
  std::string getLogPath(const Scenario &scenario) const;

  /// Write mutants.json.
  llvm::Error writeMutationList(llvm::ArrayRef<Mutation> mutations) const;

  /// Append the mutation name of a mutant outcome to the list file for its
  /// status. Other outcomes are ignored.
  llvm::Error addOutcome(const Outcome &outcome) const;

  /// Write outcomes.json.
  llvm::Error writeOutcomes(llvm::ArrayRef<Outcome> outcomes,
                            bool interrupted) const;

private:
  explicit OutputDir(std::string path) : path(std::move(path)) {}

  std::string path;
};

/// Return the name of the list file for \p status, e.g. "missed.txt".
llvm::StringRef getStatusListName(Status status);

} // namespace mutants

#endif // MUTANTS_LAB_OUTPUTDIR_H
