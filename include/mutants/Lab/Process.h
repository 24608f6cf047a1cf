//===- Process.h - Run toolchain commands in process groups -----*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Toolchain commands (cargo and whatever it spawns) run in their own process
// group so that a timeout or a stop request can kill the whole tree at once.
// runProcess() does not return until every process left in the group is
// gone.
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_LAB_PROCESS_H
#define MUTANTS_LAB_PROCESS_H

#include "mutants/Support/MutantsConfig.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace mutants {

struct ProcessOptions {
  /// argv[0] is looked up on PATH unless it contains a '/'.
  std::vector<std::string> argv;
  std::string workingDirectory;
  /// Complete environment as NAME=VALUE entries.
  std::vector<std::string> environment;
  /// stdout and stderr are appended to this file. stdin is /dev/null.
  std::string logPath;
  /// Zero means no limit.
  std::chrono::milliseconds timeout{0};
  /// When set, checked every poll interval; a true value kills the group.
  const std::atomic<bool> *stopFlag = nullptr;
  std::chrono::milliseconds pollInterval{50};
  /// Called every poll interval with the elapsed seconds.
  std::function<void(double)> onTick;
};

struct ProcessResult {
  /// Exit status, or 128 + signal number if the process was killed.
  int exitCode = 0;
  bool timedOut = false;
  bool cancelled = false;
  double seconds = 0;

  bool succeeded() const { return !timedOut && !cancelled && exitCode == 0; }
};

/// Run a command to completion. Failing to start the command is a Toolchain
/// error; failing to open the log is an Isolation error. A non-zero exit is
/// not an error.
llvm::Expected<ProcessResult> runProcess(const ProcessOptions &options);

/// Return the environment for toolchain commands: the current environment
/// minus the configured removals, plus the configured additions and
/// INSIDE_MUTANTS=true.
std::vector<std::string> buildEnvironment(const EnvironmentConfig &config);

/// Make this process the reaper of orphaned descendants so that processes
/// escaping a killed group are still collected. Linux only; elsewhere this
/// does nothing.
void becomeChildSubreaper();

} // namespace mutants

#endif // MUTANTS_LAB_PROCESS_H
