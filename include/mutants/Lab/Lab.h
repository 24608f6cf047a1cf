//===- Lab.h - Evaluate mutants with a pool of workers ----------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The lab runs the gate scenarios (the source tree when requested, then the
// unmutated baseline) one after the other, and then hands the mutants to a
// fixed pool of workers. Each worker owns one scratch copy for its lifetime
// and pulls the next mutant from a shared queue when it is done with the
// previous one. Outcomes are published in ordinal order.
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_LAB_LAB_H
#define MUTANTS_LAB_LAB_H

#include "mutants/Lab/Outcome.h"
#include "mutants/Lab/OutcomeReport.h"
#include "mutants/Lab/OutputDir.h"
#include "mutants/Lab/RunObserver.h"
#include "mutants/Lab/ScenarioRunner.h"
#include "mutants/Mutation/Mutation.h"
#include "mutants/Support/MutantsConfig.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <atomic>
#include <string>
#include <vector>

namespace mutants {

struct RunResult {
  /// Gate outcomes first, then mutant outcomes in ordinal order. Mutants that
  /// were abandoned because the run was stopped are absent.
  std::vector<Outcome> outcomes;
  RunSummary summary;
  /// Per-item problems that did not stop the run.
  std::vector<std::string> warnings;
  bool interrupted = false;

  /// Return the baseline outcome, if the baseline ran.
  const Outcome *getBaseline() const;
};

/// Return the budgets for SourceTree and Baseline phases.
PhaseTimeouts getGateTimeouts(const TimeoutConfig &config);

/// Return the budgets for mutant phases given the baseline outcome.
PhaseTimeouts getMutantTimeouts(const TimeoutConfig &config,
                                const Outcome &baseline);

class Lab {
public:
  /// \p stopFlag may be set from any thread, or from a signal handler, to
  /// stop the run.
  Lab(const MutantsConfig &config, llvm::StringRef sourceRoot,
      const OutputDir &output, RunObserver &observer,
      std::atomic<bool> &stopFlag)
      : config(config), sourceRoot(sourceRoot.str()), output(output),
        observer(observer), stopFlag(stopFlag) {}

  /// Evaluate \p mutations, numbered from 1 in the given order, into
  /// \p result.
  ///
  /// Returns a BaselineBroken error if a gate scenario does not pass, and a
  /// Toolchain error if a command cannot be started. \p result then holds
  /// the outcomes and warnings produced so far, which have also been
  /// written to the output directory. RunObserver::runFinished is sent
  /// whether or not the run fails, once the mutation list is written.
  llvm::Error run(llvm::ArrayRef<Mutation> mutations, RunResult &result);

private:
  const MutantsConfig &config;
  std::string sourceRoot;
  const OutputDir &output;
  RunObserver &observer;
  std::atomic<bool> &stopFlag;
};

} // namespace mutants

#endif // MUTANTS_LAB_LAB_H
