//===- Outcome.h - Results of one scenario ----------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Phases, their results, and the classification of a finished scenario.
//
// The phases of an outcome always appear in pipeline order and stop at the
// first phase that did not succeed. Classification is a pure function of the
// phase list:
//
//   last phase        result    mutant status    gate verdict
//   Check or Build    Failure   Unviable         Broken
//   Check or Build    Timeout   Unviable         Slow
//   Test              Failure   Caught           Broken
//   Test              Timeout   Timeout          Slow
//   Test              Success   Missed           Clean
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_LAB_OUTCOME_H
#define MUTANTS_LAB_OUTCOME_H

#include "mutants/Lab/Scenario.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"

#include <optional>
#include <string>

namespace mutants {

enum class Phase { Check, Build, Test };

enum class PhaseResult {
  Success,
  /// The command exited with a non-zero status.
  Failure,
  /// The command was killed after exceeding its budget, or was cancelled.
  Timeout,
};

/// Classification of a mutant scenario.
enum class Status {
  /// The test phase ran and failed.
  Caught,
  /// The test phase ran and succeeded.
  Missed,
  /// The mutant did not check or build.
  Unviable,
  /// The test phase exceeded its budget.
  Timeout,
};

/// Classification of a SourceTree or Baseline scenario.
enum class GateVerdict { Clean, Broken, Slow };

llvm::StringRef getPhaseName(Phase phase);
llvm::StringRef getPhaseResultName(PhaseResult result);
llvm::StringRef getStatusName(Status status);
llvm::StringRef getGateVerdictName(GateVerdict verdict);

struct PhaseRecord {
  Phase phase;
  PhaseResult result;
  /// Wall-clock duration in seconds.
  double seconds = 0;
  /// Exit status of the command; 128 + signal number if it was killed.
  int exitCode = 0;
};

/// Classify the phase list of a mutant. An empty list, which happens when the
/// mutation could not be applied, is Unviable.
Status classifyMutant(llvm::ArrayRef<PhaseRecord> phases);

/// Classify the phase list of a SourceTree or Baseline scenario. Only a run
/// that reached and passed \p finalPhase is Clean.
GateVerdict classifyGate(llvm::ArrayRef<PhaseRecord> phases, Phase finalPhase);

class Outcome {
public:
  Outcome(Scenario scenario, std::string logPath)
      : scenario(std::move(scenario)), logPath(std::move(logPath)) {}

  const Scenario &getScenario() const { return scenario; }
  llvm::ArrayRef<PhaseRecord> getPhases() const { return phases; }
  llvm::StringRef getLogPath() const { return logPath; }

  /// Append the result of the next phase. Phases must be added in pipeline
  /// order and none may follow a phase that did not succeed.
  void addPhase(const PhaseRecord &record);

  /// Mark the scenario as abandoned because the run was stopped.
  void setCancelled() { cancelled = true; }
  bool isCancelled() const { return cancelled; }

  /// Record why the scenario produced no phases.
  void setError(llvm::StringRef message) { error = message.str(); }
  llvm::StringRef getError() const { return error; }

  Status getStatus() const { return classifyMutant(phases); }
  GateVerdict getGateVerdict(Phase finalPhase = Phase::Test) const {
    return classifyGate(phases, finalPhase);
  }

  /// Return the duration of \p phase if it ran.
  std::optional<double> getPhaseSeconds(Phase phase) const;
  double getTotalSeconds() const;

  /// Read the captured log.
  llvm::Expected<std::string> readLog() const;

  llvm::json::Object toJSON() const;

private:
  Scenario scenario;
  std::string logPath;
  llvm::SmallVector<PhaseRecord, 3> phases;
  std::string error;
  bool cancelled = false;
};

} // namespace mutants

#endif // MUTANTS_LAB_OUTCOME_H
