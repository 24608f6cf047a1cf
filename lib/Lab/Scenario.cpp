//===- Scenario.cpp - What one pipeline run tests -------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutants/Lab/Scenario.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/raw_ostream.h"

using namespace mutants;

llvm::StringRef mutants::getScenarioKindName(ScenarioKind kind) {
  switch (kind) {
  case ScenarioKind::SourceTree:
    return "source_tree";
  case ScenarioKind::Baseline:
    return "baseline";
  case ScenarioKind::Mutant:
    return "mutant";
  }
  llvm_unreachable("unknown scenario kind");
}

std::string Scenario::describe() const {
  switch (kind) {
  case ScenarioKind::SourceTree:
    return "Source tree";
  case ScenarioKind::Baseline:
    return "Unmutated baseline";
  case ScenarioKind::Mutant:
    return mutation->getName();
  }
  llvm_unreachable("unknown scenario kind");
}

std::string Scenario::getLogName() const {
  if (!isMutant())
    return getScenarioKindName(kind).str();

  std::string out;
  llvm::raw_string_ostream os(out);
  os << llvm::format("%04u", ordinal) << "-";
  for (char c : mutation->getLocation()) {
    if (c == '/' || c == '\\')
      os << "__";
    else if (c == ':')
      os << '_';
    else if (llvm::isAlnum(c) || c == '.' || c == '-' || c == '_')
      os << c;
    else
      os << '_';
  }
  os.flush();
  return out;
}
