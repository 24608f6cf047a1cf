//===- Lab.cpp - Evaluate mutants with a pool of workers ------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutants/Lab/Lab.h"
#include "mutants/Lab/BuildDir.h"
#include "mutants/Lab/Process.h"
#include "mutants/Support/MutantsError.h"

#include "llvm/Support/Debug.h"

#include <algorithm>
#include <chrono>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>

#define DEBUG_TYPE "mutants-lab"

using namespace mutants;
using llvm::StringRef;

RunObserver::~RunObserver() = default;

const Outcome *RunResult::getBaseline() const {
  for (const Outcome &outcome : outcomes)
    if (outcome.getScenario().getKind() == ScenarioKind::Baseline)
      return &outcome;
  return nullptr;
}

//===----------------------------------------------------------------------===//
// Timeouts
//===----------------------------------------------------------------------===//

static std::chrono::milliseconds getGateBudget(double explicitSeconds,
                                               const TimeoutConfig &config) {
  return secondsToBudget(explicitSeconds > 0 ? explicitSeconds
                                             : config.baseline);
}

static std::chrono::milliseconds
getMutantBudget(double explicitSeconds, const TimeoutConfig &config,
                std::optional<double> baselineSeconds) {
  if (explicitSeconds > 0)
    return secondsToBudget(explicitSeconds);
  double derived = config.multiplier * baselineSeconds.value_or(0);
  return secondsToBudget(std::max(config.minimum, derived));
}

PhaseTimeouts mutants::getGateTimeouts(const TimeoutConfig &config) {
  PhaseTimeouts timeouts;
  timeouts.check = getGateBudget(config.check, config);
  timeouts.build = getGateBudget(config.build, config);
  timeouts.test = getGateBudget(config.test, config);
  return timeouts;
}

PhaseTimeouts mutants::getMutantTimeouts(const TimeoutConfig &config,
                                         const Outcome &baseline) {
  PhaseTimeouts timeouts;
  timeouts.check = getMutantBudget(config.check, config,
                                   baseline.getPhaseSeconds(Phase::Check));
  timeouts.build = getMutantBudget(config.build, config,
                                   baseline.getPhaseSeconds(Phase::Build));
  timeouts.test = getMutantBudget(config.test, config,
                                  baseline.getPhaseSeconds(Phase::Test));
  return timeouts;
}

//===----------------------------------------------------------------------===//
// Worker pool
//===----------------------------------------------------------------------===//

namespace {

using CopyFactory =
    std::function<llvm::Expected<std::unique_ptr<BuildDir>>()>;

/// Forwards events to another observer, one call at a time.
class LockedObserver : public RunObserver {
public:
  explicit LockedObserver(RunObserver &target) : target(target) {}

  void copyStarted(StringRef sourceRoot) override {
    std::lock_guard<std::mutex> lock(mutex);
    target.copyStarted(sourceRoot);
  }
  void copyFinished(uint64_t bytes, double seconds) override {
    std::lock_guard<std::mutex> lock(mutex);
    target.copyFinished(bytes, seconds);
  }
  void scenarioStarted(const Scenario &scenario) override {
    std::lock_guard<std::mutex> lock(mutex);
    target.scenarioStarted(scenario);
  }
  void scenarioTick(const Scenario &scenario, Phase phase,
                    double elapsedSeconds) override {
    std::lock_guard<std::mutex> lock(mutex);
    target.scenarioTick(scenario, phase, elapsedSeconds);
  }
  void scenarioFinished(const Outcome &outcome) override {
    std::lock_guard<std::mutex> lock(mutex);
    target.scenarioFinished(outcome);
  }
  void runFinished(const RunResult &result) override {
    std::lock_guard<std::mutex> lock(mutex);
    target.runFinished(result);
  }

private:
  RunObserver &target;
  std::mutex mutex;
};

class WorkerPool {
public:
  WorkerPool(llvm::ArrayRef<Mutation> mutations, const ScenarioRunner &runner,
             const PhaseTimeouts &timeouts, const OutputDir &output,
             RunObserver &observer, const std::atomic<bool> &stopFlag,
             CopyFactory prepareCopy, RunResult &result)
      : mutations(mutations), runner(runner), timeouts(timeouts),
        output(output), observer(observer), stopFlag(stopFlag),
        prepareCopy(std::move(prepareCopy)), result(result) {}

  /// Evaluate every mutation with \p workers workers. The first worker
  /// starts with \p firstCopy; the others make their own copies. Returns the
  /// first structural error any worker hit.
  llvm::Error run(std::unique_ptr<BuildDir> firstCopy, unsigned workers);

private:
  struct WorkItem {
    size_t index;
    /// Number of earlier attempts that failed to isolate the mutant.
    unsigned attempts;
  };

  void work(std::unique_ptr<BuildDir> dir);

  /// Pop the next mutant unless the run is stopping.
  bool takeItem(WorkItem &item);

  /// Buffer \p outcome and publish every outcome that is now in order.
  /// Requires the mutex.
  void deliver(Outcome outcome);
  void publish(Outcome outcome);

  /// Try to make a fresh copy, recording a warning on failure.
  std::unique_ptr<BuildDir> replaceCopy();

  llvm::ArrayRef<Mutation> mutations;
  const ScenarioRunner &runner;
  const PhaseTimeouts &timeouts;
  const OutputDir &output;
  RunObserver &observer;
  const std::atomic<bool> &stopFlag;
  CopyFactory prepareCopy;
  RunResult &result;

  std::mutex mutex;
  std::deque<WorkItem> queue;
  std::map<size_t, Outcome> pending;
  size_t nextToPublish = 0;
  unsigned liveWorkers = 0;
  std::optional<std::string> fatalMessage;
  ErrorKind fatalKind = ErrorKind::Toolchain;
};

} // namespace

bool WorkerPool::takeItem(WorkItem &item) {
  std::lock_guard<std::mutex> lock(mutex);
  if (queue.empty() || fatalMessage || stopFlag.load())
    return false;
  item = queue.front();
  queue.pop_front();
  return true;
}

void WorkerPool::publish(Outcome outcome) {
  observer.scenarioFinished(outcome);
  if (auto err = output.addOutcome(outcome))
    result.warnings.push_back(llvm::toString(std::move(err)));
  result.outcomes.push_back(std::move(outcome));
}

void WorkerPool::deliver(Outcome outcome) {
  size_t index = outcome.getScenario().getOrdinal() - 1;
  pending.emplace(index, std::move(outcome));
  while (!pending.empty() && pending.begin()->first == nextToPublish) {
    publish(std::move(pending.begin()->second));
    pending.erase(pending.begin());
    ++nextToPublish;
  }
}

std::unique_ptr<BuildDir> WorkerPool::replaceCopy() {
  auto copy = prepareCopy();
  if (copy)
    return std::move(*copy);
  std::string message = llvm::toString(copy.takeError());
  std::lock_guard<std::mutex> lock(mutex);
  result.warnings.push_back("worker stopped: " + message);
  return nullptr;
}

void WorkerPool::work(std::unique_ptr<BuildDir> dir) {
  if (!dir)
    dir = replaceCopy();

  WorkItem item;
  while (dir && takeItem(item)) {
    const Mutation &mutation = mutations[item.index];
    Scenario scenario =
        Scenario::mutant(mutation, item.index + 1, mutations.size());
    std::string logPath = output.getLogPath(scenario);

    observer.scenarioStarted(scenario);
    auto outcome = runner.run(scenario, dir->getPath(), dir.get(), logPath,
                              timeouts, &observer);
    if (outcome) {
      // Abandoned scenarios are not reported.
      if (outcome->isCancelled())
        continue;
      std::lock_guard<std::mutex> lock(mutex);
      deliver(std::move(*outcome));
      continue;
    }

    std::string message;
    ErrorKind kind = takeErrorKind(outcome.takeError(), message);
    if (!isRecoverable(kind)) {
      std::lock_guard<std::mutex> lock(mutex);
      if (!fatalMessage) {
        fatalMessage = message;
        fatalKind = kind;
      }
      continue;
    }

    LLVM_DEBUG(llvm::dbgs() << "isolation failure on " << mutation.getName()
                            << ": " << message << "\n");
    {
      std::lock_guard<std::mutex> lock(mutex);
      result.warnings.push_back(mutation.getName() + ": " + message);
      if (item.attempts == 0) {
        queue.push_back({item.index, item.attempts + 1});
      } else {
        Outcome failed(scenario, logPath);
        failed.setError(message);
        deliver(std::move(failed));
      }
    }

    // The copy may be damaged.
    dir.reset();
    dir = replaceCopy();
  }

  std::lock_guard<std::mutex> lock(mutex);
  --liveWorkers;
  if (liveWorkers != 0 || fatalMessage || stopFlag.load())
    return;
  // No worker is left to take what remains in the queue.
  while (!queue.empty()) {
    WorkItem left = queue.front();
    queue.pop_front();
    Scenario scenario = Scenario::mutant(mutations[left.index],
                                         left.index + 1, mutations.size());
    Outcome failed(scenario, output.getLogPath(scenario));
    failed.setError("no scratch copy available");
    deliver(std::move(failed));
  }
}

llvm::Error WorkerPool::run(std::unique_ptr<BuildDir> firstCopy,
                            unsigned workers) {
  for (size_t i = 0; i < mutations.size(); ++i)
    queue.push_back({i, 0});
  liveWorkers = workers;
  LLVM_DEBUG(llvm::dbgs() << "starting " << workers << " workers for "
                          << mutations.size() << " mutants\n");

  std::vector<std::thread> threads;
  threads.emplace_back([this, dir = std::move(firstCopy)]() mutable {
    work(std::move(dir));
  });
  for (unsigned i = 1; i < workers; ++i)
    threads.emplace_back([this] { work(nullptr); });
  for (std::thread &thread : threads)
    thread.join();

  // Anything still buffered follows a mutant that never finished.
  for (auto &entry : pending)
    publish(std::move(entry.second));
  pending.clear();

  if (fatalMessage)
    return makeError(fatalKind, *fatalMessage);
  return llvm::Error::success();
}

//===----------------------------------------------------------------------===//
// Lab
//===----------------------------------------------------------------------===//

llvm::Error Lab::run(llvm::ArrayRef<Mutation> mutations, RunResult &result) {
  result = RunResult();
  LockedObserver locked(observer);

  if (auto err = output.writeMutationList(mutations))
    return err;

  ScenarioRunner runner(config.getCommands(),
                        buildEnvironment(config.getEnvironment()), &stopFlag);
  PhaseTimeouts gateTimeouts = getGateTimeouts(config.getTimeouts());
  CopyFactory prepareCopy = [this] {
    return BuildDir::prepare(sourceRoot, config.getCopy(),
                             config.getLeaveCopies());
  };

  // Write and report what ran so far, then hand back \p err.
  auto finish = [&](llvm::Error err) -> llvm::Error {
    result.summary = RunSummary::summarize(result.outcomes);
    result.interrupted = stopFlag.load();
    if (auto writeErr =
            output.writeOutcomes(result.outcomes, result.interrupted))
      result.warnings.push_back(llvm::toString(std::move(writeErr)));
    locked.runFinished(result);
    return err;
  };

  auto runGate = [&](const Scenario &scenario, StringRef workDir,
                     BuildDir *dir) -> llvm::Error {
    locked.scenarioStarted(scenario);
    auto outcome = runner.run(scenario, workDir, dir,
                              output.getLogPath(scenario), gateTimeouts,
                              &locked);
    if (!outcome)
      return outcome.takeError();
    if (outcome->isCancelled())
      return llvm::Error::success();

    locked.scenarioFinished(*outcome);
    GateVerdict verdict = outcome->getGateVerdict();
    std::string logPath = outcome->getLogPath().str();
    result.outcomes.push_back(std::move(*outcome));
    if (verdict == GateVerdict::Clean)
      return llvm::Error::success();
    return makeError(ErrorKind::BaselineBroken,
                     scenario.describe() +
                         (verdict == GateVerdict::Slow
                              ? " exceeded its timeout"
                              : " failed") +
                         "; see " + logPath);
  };

  if (config.getTestSourceTree()) {
    if (auto err = runGate(Scenario::sourceTree(), sourceRoot, nullptr))
      return finish(std::move(err));
    if (stopFlag.load())
      return finish(llvm::Error::success());
  }

  locked.copyStarted(sourceRoot);
  auto copyStart = std::chrono::steady_clock::now();
  auto firstCopy = prepareCopy();
  if (!firstCopy)
    return finish(firstCopy.takeError());
  std::chrono::duration<double> copyTime =
      std::chrono::steady_clock::now() - copyStart;
  locked.copyFinished((*firstCopy)->getBytesCopied(), copyTime.count());

  if (auto err = runGate(Scenario::baseline(), (*firstCopy)->getPath(),
                         firstCopy->get()))
    return finish(std::move(err));
  const Outcome *baseline = result.getBaseline();
  if (!baseline || mutations.empty() || stopFlag.load())
    return finish(llvm::Error::success());

  PhaseTimeouts timeouts = getMutantTimeouts(config.getTimeouts(), *baseline);
  LLVM_DEBUG(llvm::dbgs() << "mutant timeouts: check "
                          << timeouts.check.count() << "ms, build "
                          << timeouts.build.count() << "ms, test "
                          << timeouts.test.count() << "ms\n");

  unsigned workers = static_cast<unsigned>(std::min<size_t>(
      config.getEffectiveJobs(), mutations.size()));
  WorkerPool pool(mutations, runner, timeouts, output, locked, stopFlag,
                  prepareCopy, result);
  return finish(pool.run(std::move(*firstCopy), workers));
}
