//===- OutcomeReport.h - Machine-readable run reports -----------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Summaries of a set of outcomes, and writers for outcomes.json and JUnit XML.
//
// In JUnit output every mutant is one test case: a caught mutant passes, a
// missed mutant is a failure, a timeout is an error and an unviable mutant is
// skipped.
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_LAB_OUTCOMEREPORT_H
#define MUTANTS_LAB_OUTCOMEREPORT_H

#include "mutants/Lab/Outcome.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

namespace mutants {

/// Counts of mutant outcomes by status.
struct RunSummary {
  unsigned caught = 0;
  unsigned missed = 0;
  unsigned unviable = 0;
  unsigned timeouts = 0;

  unsigned getTotal() const { return caught + missed + unviable + timeouts; }

  void add(Status status);

  /// Count the mutant outcomes in \p outcomes; other scenarios are ignored.
  static RunSummary summarize(llvm::ArrayRef<Outcome> outcomes);

  llvm::json::Object toJSON() const;
};

/// Build the outcomes.json document: every outcome in order, the summary
/// counts, and whether the run was interrupted.
llvm::json::Value outcomesToJSON(llvm::ArrayRef<Outcome> outcomes,
                                 bool interrupted);

/// Write the mutant outcomes as a JUnit XML document with one test suite named
/// \p suiteName.
void writeJUnitXML(llvm::raw_ostream &os, llvm::ArrayRef<Outcome> outcomes,
                   llvm::StringRef suiteName);

/// Write JUnit XML to \p path.
llvm::Error writeJUnitXMLFile(llvm::StringRef path,
                              llvm::ArrayRef<Outcome> outcomes,
                              llvm::StringRef suiteName);

} // namespace mutants

#endif // MUTANTS_LAB_OUTCOMEREPORT_H
