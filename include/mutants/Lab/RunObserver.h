//===- RunObserver.h - Events emitted by a mutation run ---------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// The lab never writes to the terminal. Progress is published through this
// interface; the console reporter of the mutants tool is one implementation.
//
// Calls are serialized by the lab, so implementations need no locking.
// scenarioFinished() is called in ordinal order; scenarioStarted() and
// scenarioTick() follow the order in which workers pick up scenarios.
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_LAB_RUNOBSERVER_H
#define MUTANTS_LAB_RUNOBSERVER_H

#include "mutants/Lab/Outcome.h"
#include "llvm/ADT/StringRef.h"

#include <cstdint>

namespace mutants {

struct RunResult;

class RunObserver {
public:
  virtual ~RunObserver();

  /// A scratch copy of \p sourceRoot is being made.
  virtual void copyStarted(llvm::StringRef sourceRoot) {}
  virtual void copyFinished(uint64_t bytes, double seconds) {}

  virtual void scenarioStarted(const Scenario &scenario) {}

  /// Called periodically while \p phase of \p scenario runs.
  virtual void scenarioTick(const Scenario &scenario, Phase phase,
                            double elapsedSeconds) {}

  /// Exactly once per scenario that ran to completion.
  virtual void scenarioFinished(const Outcome &outcome) {}

  virtual void runFinished(const RunResult &result) {}
};

} // namespace mutants

#endif // MUTANTS_LAB_RUNOBSERVER_H
