//===- ScenarioRunner.h - Drive one scenario through the pipeline -*- C++ -*-=//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Runs Check (when enabled), Build and Test in order, stopping at the first
// phase that does not succeed. Every phase is logged to the scenario's log
// file as
//
//   $ cargo build --tests
//   <combined stdout and stderr>
//   --- build success in 4.210s ---
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_LAB_SCENARIORUNNER_H
#define MUTANTS_LAB_SCENARIORUNNER_H

#include "mutants/Lab/BuildDir.h"
#include "mutants/Lab/Outcome.h"
#include "mutants/Lab/RunObserver.h"
#include "mutants/Support/MutantsConfig.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Error.h"

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

namespace mutants {

/// Per-phase budgets; zero means unlimited.
struct PhaseTimeouts {
  std::chrono::milliseconds check{0};
  std::chrono::milliseconds build{0};
  std::chrono::milliseconds test{0};

  std::chrono::milliseconds get(Phase phase) const;
};

/// Convert seconds from the configuration into a budget.
std::chrono::milliseconds secondsToBudget(double seconds);

class ScenarioRunner {
public:
  ScenarioRunner(CommandConfig commands, std::vector<std::string> environment,
                 const std::atomic<bool> *stopFlag = nullptr)
      : commands(std::move(commands)), environment(std::move(environment)),
        stopFlag(stopFlag) {}

  /// The phases every scenario goes through, in order.
  llvm::SmallVector<Phase, 3> getPhases() const;

  llvm::ArrayRef<std::string> getCommand(Phase phase) const;

  /// Run \p scenario with \p workDir as the working directory. A mutant's
  /// mutation is applied to \p buildDir first and reverted before returning,
  /// whatever the result. Errors are Toolchain errors (a command could not
  /// start) or Isolation errors (the copy or the log could not be written).
  llvm::Expected<Outcome> run(const Scenario &scenario,
                              llvm::StringRef workDir, BuildDir *buildDir,
                              llvm::StringRef logPath,
                              const PhaseTimeouts &timeouts,
                              RunObserver *observer = nullptr) const;

private:
  llvm::Error runPhases(const Scenario &scenario, llvm::StringRef workDir,
                        llvm::StringRef logPath, const PhaseTimeouts &timeouts,
                        RunObserver *observer, Outcome &outcome) const;

  CommandConfig commands;
  std::vector<std::string> environment;
  const std::atomic<bool> *stopFlag;
};

} // namespace mutants

#endif // MUTANTS_LAB_SCENARIORUNNER_H
