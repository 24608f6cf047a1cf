//===- ConsoleReporter.h - Terminal output for mutation runs ----*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Renders lab events as one line per scenario:
//
//   Copy source to scratch directory ... done
//   Unmutated baseline ... ok in 3.200s
//   src/lib.rs:4:28: replace half -> i64 with 0 ... caught in 0.512s
//   src/lib.rs:4:28: replace half -> i64 with 1 ... NOT CAUGHT in 0.498s
//
// On a terminal, a status line shows the scenario in progress and is erased
// before the next permanent line.
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_TOOLS_CONSOLEREPORTER_H
#define MUTANTS_TOOLS_CONSOLEREPORTER_H

#include "mutants/Lab/Lab.h"
#include "mutants/Lab/RunObserver.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/Support/raw_ostream.h"

#include <chrono>
#include <string>
#include <vector>

namespace mutants {

/// Which scenario logs are copied to the console after the scenario line.
/// Logs of gate scenarios that fail are always shown.
struct LogSelection {
  bool caught = false;
  bool unviable = false;
  bool all = false;
};

class ConsoleReporter : public RunObserver {
public:
  ConsoleReporter(llvm::raw_ostream &os, LogSelection logs = LogSelection());

  void setUseColors(bool enable) { useColors = enable; }
  void setShowProgress(bool enable) { showProgress = enable; }

  /// Problems found before the run, printed again in the final summary.
  void addWarnings(llvm::ArrayRef<std::string> more);

  void copyStarted(llvm::StringRef sourceRoot) override;
  void copyFinished(uint64_t bytes, double seconds) override;
  void scenarioStarted(const Scenario &scenario) override;
  void scenarioTick(const Scenario &scenario, Phase phase,
                    double elapsedSeconds) override;
  void scenarioFinished(const Outcome &outcome) override;
  void runFinished(const RunResult &result) override;

  /// Return the summary line, e.g. "3 mutants tested in 4.210s: 1 missed,
  /// 2 caught".
  static std::string formatSummary(const RunSummary &summary, double seconds);

private:
  bool shouldPrintLog(const Outcome &outcome) const;
  void printLabel(const Outcome &outcome);
  void printLog(const Outcome &outcome);
  void clearStatus();

  llvm::raw_ostream &os;
  LogSelection logs;
  bool useColors;
  bool showProgress;
  bool statusShown = false;
  std::chrono::steady_clock::time_point start;
  std::chrono::steady_clock::time_point lastStatus;
  std::vector<std::string> warnings;
};

} // namespace mutants

#endif // MUTANTS_TOOLS_CONSOLEREPORTER_H
