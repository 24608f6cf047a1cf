//===- Scenario.h - What one pipeline run tests -----------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A scenario is one trip through the Check/Build/Test pipeline: over the
// original source tree, over an unmutated copy (the baseline), or over a copy
// carrying exactly one mutation.
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_LAB_SCENARIO_H
#define MUTANTS_LAB_SCENARIO_H

#include "mutants/Mutation/Mutation.h"
#include "llvm/ADT/StringRef.h"

#include <optional>
#include <string>

namespace mutants {

enum class ScenarioKind { SourceTree, Baseline, Mutant };

llvm::StringRef getScenarioKindName(ScenarioKind kind);

class Scenario {
public:
  static Scenario sourceTree() { return Scenario(ScenarioKind::SourceTree); }
  static Scenario baseline() { return Scenario(ScenarioKind::Baseline); }

  /// A mutant scenario; \p ordinal is 1-based.
  static Scenario mutant(const Mutation &mutation, unsigned ordinal,
                         unsigned total) {
    Scenario scenario(ScenarioKind::Mutant);
    scenario.mutation = mutation;
    scenario.ordinal = ordinal;
    scenario.total = total;
    return scenario;
  }

  ScenarioKind getKind() const { return kind; }
  bool isMutant() const { return kind == ScenarioKind::Mutant; }

  /// The applied mutation, or null for SourceTree and Baseline.
  const Mutation *getMutation() const {
    return mutation ? &*mutation : nullptr;
  }

  unsigned getOrdinal() const { return ordinal; }
  unsigned getTotal() const { return total; }

  /// A one-line description for progress output.
  std::string describe() const;

  /// The log file stem: "source_tree", "baseline", or
  /// "0007-src__lib.rs_12_5" (ordinal and mangled location) for mutants.
  std::string getLogName() const;

private:
  explicit Scenario(ScenarioKind kind) : kind(kind) {}

  ScenarioKind kind;
  std::optional<Mutation> mutation;
  unsigned ordinal = 0;
  unsigned total = 0;
};

} // namespace mutants

#endif // MUTANTS_LAB_SCENARIO_H
