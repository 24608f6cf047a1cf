//===- ScenarioRunner.cpp - Drive one scenario through the pipeline -------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutants/Lab/ScenarioRunner.h"
#include "mutants/Lab/Process.h"
#include "mutants/Support/MutantsError.h"

#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/raw_ostream.h"

#include <cmath>

#define DEBUG_TYPE "mutants-lab"

using namespace mutants;
using llvm::StringRef;

std::chrono::milliseconds PhaseTimeouts::get(Phase phase) const {
  switch (phase) {
  case Phase::Check:
    return check;
  case Phase::Build:
    return build;
  case Phase::Test:
    return test;
  }
  llvm_unreachable("unknown phase");
}

std::chrono::milliseconds mutants::secondsToBudget(double seconds) {
  if (seconds <= 0)
    return std::chrono::milliseconds(0);
  return std::chrono::milliseconds(
      static_cast<int64_t>(std::ceil(seconds * 1000)));
}

/// Write \p text to the log, truncating it first if \p append is false.
static llvm::Error writeLog(StringRef logPath, const llvm::Twine &text,
                            bool append) {
  std::error_code ec;
  llvm::raw_fd_ostream os(logPath, ec,
                          append ? llvm::sys::fs::OF_Append
                                 : llvm::sys::fs::OF_None);
  if (ec)
    return makeError(ErrorKind::Isolation,
                     "cannot write log " + logPath + ": " + ec.message());
  os << text;
  os.close();
  if (os.has_error()) {
    std::error_code writeError = os.error();
    os.clear_error();
    return makeError(ErrorKind::Isolation, "cannot write log " + logPath +
                                               ": " + writeError.message());
  }
  return llvm::Error::success();
}

llvm::SmallVector<Phase, 3> ScenarioRunner::getPhases() const {
  llvm::SmallVector<Phase, 3> phases;
  if (commands.checkEnabled && !commands.check.empty())
    phases.push_back(Phase::Check);
  phases.push_back(Phase::Build);
  phases.push_back(Phase::Test);
  return phases;
}

llvm::ArrayRef<std::string> ScenarioRunner::getCommand(Phase phase) const {
  switch (phase) {
  case Phase::Check:
    return commands.check;
  case Phase::Build:
    return commands.build;
  case Phase::Test:
    return commands.test;
  }
  llvm_unreachable("unknown phase");
}

llvm::Error ScenarioRunner::runPhases(const Scenario &scenario,
                                      StringRef workDir, StringRef logPath,
                                      const PhaseTimeouts &timeouts,
                                      RunObserver *observer,
                                      Outcome &outcome) const {
  for (Phase phase : getPhases()) {
    if (stopFlag && stopFlag->load()) {
      outcome.setCancelled();
      break;
    }

    llvm::ArrayRef<std::string> argv = getCommand(phase);
    if (auto err =
            writeLog(logPath, "\n$ " + joinCommandLine(argv) + "\n", true))
      return err;

    ProcessOptions options;
    options.argv.assign(argv.begin(), argv.end());
    options.workingDirectory = workDir.str();
    options.environment = environment;
    options.logPath = logPath.str();
    options.timeout = timeouts.get(phase);
    options.stopFlag = stopFlag;
    if (observer)
      options.onTick = [&, phase](double elapsed) {
        observer->scenarioTick(scenario, phase, elapsed);
      };

    LLVM_DEBUG(llvm::dbgs() << scenario.describe() << ": running "
                            << getPhaseName(phase) << " in " << workDir
                            << "\n");
    auto result = runProcess(options);
    if (!result)
      return result.takeError();

    PhaseRecord record;
    record.phase = phase;
    record.seconds = result->seconds;
    record.exitCode = result->exitCode;
    if (result->succeeded())
      record.result = PhaseResult::Success;
    else if (result->timedOut || result->cancelled)
      record.result = PhaseResult::Timeout;
    else
      record.result = PhaseResult::Failure;

    std::string trailer;
    llvm::raw_string_ostream os(trailer);
    os << "\n--- " << getPhaseName(phase) << " "
       << getPhaseResultName(record.result) << " in "
       << llvm::format("%.3f", record.seconds) << "s ---\n";
    if (auto err = writeLog(logPath, os.str(), true))
      return err;

    outcome.addPhase(record);
    if (result->cancelled) {
      outcome.setCancelled();
      break;
    }
    if (record.result != PhaseResult::Success)
      break;
  }
  return llvm::Error::success();
}

llvm::Expected<Outcome>
ScenarioRunner::run(const Scenario &scenario, StringRef workDir,
                    BuildDir *buildDir, StringRef logPath,
                    const PhaseTimeouts &timeouts,
                    RunObserver *observer) const {
  Outcome outcome(scenario, logPath.str());
  std::string header = scenario.describe() + "\n";

  const Mutation *mutation = scenario.getMutation();
  if (mutation) {
    if (!buildDir)
      return makeError(ErrorKind::Isolation,
                       "no scratch copy for " + mutation->getName());
    if (auto err = buildDir->apply(*mutation))
      return std::move(err);
    header += "\n" + mutation->getUnifiedDiff(buildDir->getOriginalText());
  }

  llvm::Error err = writeLog(logPath, header, /*append=*/false);
  if (!err)
    err = runPhases(scenario, workDir, logPath, timeouts, observer, outcome);

  // The copy is restored whatever happened above.
  if (mutation)
    err = llvm::joinErrors(std::move(err), buildDir->reset());
  if (err)
    return std::move(err);
  return std::move(outcome);
}
