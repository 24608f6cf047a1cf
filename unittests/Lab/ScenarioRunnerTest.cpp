//===- ScenarioRunnerTest.cpp - Unit tests for the phase pipeline ---------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "LabTestUtils.h"
#include "mutants/Lab/Process.h"
#include "mutants/Lab/ScenarioRunner.h"
#include "mutants/Support/MutantsError.h"
#include "gtest/gtest.h"

using namespace mutants;
using namespace mutants::test;

namespace {

/// Fails when the mutation marker is present in src/lib.rs.
constexpr const char *kDetectMutation =
    "! grep -q 'changed by mutants' src/lib.rs";

class ScenarioRunnerTest : public ::testing::Test {
protected:
  void SetUp() override {
    tree.write("src/lib.rs", kHalfSource);
    commands.check = shell("echo checking");
    commands.build = shell("echo building");
    commands.test = shell("echo testing");
  }

  llvm::Expected<Outcome> run(const Scenario &scenario,
                              BuildDir *dir = nullptr,
                              const std::atomic<bool> *stop = nullptr) {
    ScenarioRunner runner(commands, buildEnvironment(EnvironmentConfig()),
                          stop);
    llvm::StringRef workDir = dir ? dir->getPath() : tree.getPath();
    return runner.run(scenario, workDir, dir, logs.getPath("scenario.log"),
                      timeouts);
  }

  static std::vector<Phase> phasesOf(const Outcome &outcome) {
    std::vector<Phase> phases;
    for (const PhaseRecord &record : outcome.getPhases())
      phases.push_back(record.phase);
    return phases;
  }

  TempTree tree;
  TempTree logs;
  CommandConfig commands;
  PhaseTimeouts timeouts;
};

TEST_F(ScenarioRunnerTest, CleanPipeline) {
  auto outcome = run(Scenario::baseline());
  ASSERT_TRUE(static_cast<bool>(outcome))
      << llvm::toString(outcome.takeError());
  EXPECT_EQ(phasesOf(*outcome),
            (std::vector<Phase>{Phase::Check, Phase::Build, Phase::Test}));
  EXPECT_EQ(outcome->getGateVerdict(), GateVerdict::Clean);
  EXPECT_FALSE(outcome->isCancelled());

  std::string log = logs.read("scenario.log");
  EXPECT_EQ(log.find("Unmutated baseline\n"), 0u);
  EXPECT_NE(log.find("$ /bin/sh -c 'echo building'\nbuilding\n"),
            std::string::npos);
  EXPECT_NE(log.find("--- check success in "), std::string::npos);
  EXPECT_NE(log.find("--- test success in "), std::string::npos);
}

TEST_F(ScenarioRunnerTest, CheckCanBeDisabled) {
  commands.checkEnabled = false;
  auto outcome = run(Scenario::baseline());
  ASSERT_TRUE(static_cast<bool>(outcome))
      << llvm::toString(outcome.takeError());
  EXPECT_EQ(phasesOf(*outcome),
            (std::vector<Phase>{Phase::Build, Phase::Test}));
  EXPECT_EQ(logs.read("scenario.log").find("checking"), std::string::npos);
}

TEST_F(ScenarioRunnerTest, StopsAtFirstFailure) {
  commands.build = shell("echo broken; exit 101");
  auto outcome = run(Scenario::baseline());
  ASSERT_TRUE(static_cast<bool>(outcome))
      << llvm::toString(outcome.takeError());
  EXPECT_EQ(phasesOf(*outcome),
            (std::vector<Phase>{Phase::Check, Phase::Build}));
  EXPECT_EQ(outcome->getPhases().back().result, PhaseResult::Failure);
  EXPECT_EQ(outcome->getPhases().back().exitCode, 101);
  EXPECT_EQ(outcome->getGateVerdict(), GateVerdict::Broken);

  std::string log = logs.read("scenario.log");
  EXPECT_NE(log.find("--- build failure in "), std::string::npos);
  EXPECT_EQ(log.find("testing"), std::string::npos);
}

TEST_F(ScenarioRunnerTest, MutantIsAppliedAndReverted) {
  commands.test = shell(kDetectMutation);
  auto dir = BuildDir::prepare(tree.getPath(), CopyConfig());
  ASSERT_TRUE(static_cast<bool>(dir)) << llvm::toString(dir.takeError());

  auto outcome = run(Scenario::mutant(makeHalfMutation(), 1, 1), dir->get());
  ASSERT_TRUE(static_cast<bool>(outcome))
      << llvm::toString(outcome.takeError());
  EXPECT_EQ(outcome->getStatus(), Status::Caught);
  EXPECT_FALSE((*dir)->hasMutation());

  llvm::SmallString<128> copied((*dir)->getPath());
  llvm::sys::path::append(copied, "src/lib.rs");
  EXPECT_EQ(TempTree::readFile(copied), kHalfSource);
  EXPECT_EQ(tree.read("src/lib.rs"), kHalfSource);

  std::string log = logs.read("scenario.log");
  EXPECT_EQ(log.find("src/lib.rs:1:28: replace half -> i64 with 0\n"), 0u);
  EXPECT_NE(log.find("+pub fn half(x: i64) -> i64 { 0 /* ~ changed by "
                     "mutants ~ */ }"),
            std::string::npos);
}

TEST_F(ScenarioRunnerTest, UndetectedMutantIsMissed) {
  auto dir = BuildDir::prepare(tree.getPath(), CopyConfig());
  ASSERT_TRUE(static_cast<bool>(dir)) << llvm::toString(dir.takeError());
  auto outcome = run(Scenario::mutant(makeHalfMutation(), 1, 1), dir->get());
  ASSERT_TRUE(static_cast<bool>(outcome))
      << llvm::toString(outcome.takeError());
  EXPECT_EQ(outcome->getStatus(), Status::Missed);
}

TEST_F(ScenarioRunnerTest, MutantThatDoesNotBuildIsUnviable) {
  commands.build = shell(kDetectMutation);
  auto dir = BuildDir::prepare(tree.getPath(), CopyConfig());
  ASSERT_TRUE(static_cast<bool>(dir)) << llvm::toString(dir.takeError());
  auto outcome = run(Scenario::mutant(makeHalfMutation(), 1, 1), dir->get());
  ASSERT_TRUE(static_cast<bool>(outcome))
      << llvm::toString(outcome.takeError());
  EXPECT_EQ(outcome->getStatus(), Status::Unviable);
  EXPECT_EQ(outcome->getPhases().back().phase, Phase::Build);
}

TEST_F(ScenarioRunnerTest, TestTimeout) {
  commands.test = shell("sleep 30");
  timeouts.test = std::chrono::milliseconds(300);
  auto dir = BuildDir::prepare(tree.getPath(), CopyConfig());
  ASSERT_TRUE(static_cast<bool>(dir)) << llvm::toString(dir.takeError());
  auto outcome = run(Scenario::mutant(makeHalfMutation(), 1, 1), dir->get());
  ASSERT_TRUE(static_cast<bool>(outcome))
      << llvm::toString(outcome.takeError());
  EXPECT_EQ(outcome->getStatus(), Status::Timeout);
  EXPECT_EQ(outcome->getPhases().back().result, PhaseResult::Timeout);
  EXPECT_NE(logs.read("scenario.log").find("--- test timeout in "),
            std::string::npos);
}

TEST_F(ScenarioRunnerTest, StopFlagCancelsScenario) {
  std::atomic<bool> stop(true);
  auto outcome = run(Scenario::baseline(), nullptr, &stop);
  ASSERT_TRUE(static_cast<bool>(outcome))
      << llvm::toString(outcome.takeError());
  EXPECT_TRUE(outcome->isCancelled());
  EXPECT_TRUE(outcome->getPhases().empty());
}

TEST_F(ScenarioRunnerTest, MutantWithoutCopyIsIsolationError) {
  auto outcome = run(Scenario::mutant(makeHalfMutation(), 1, 1));
  ASSERT_FALSE(static_cast<bool>(outcome));
  std::string message;
  EXPECT_EQ(takeErrorKind(outcome.takeError(), message), ErrorKind::Isolation);
  EXPECT_EQ(tree.read("src/lib.rs"), kHalfSource);
}

TEST_F(ScenarioRunnerTest, UnlaunchableCommandRevertsMutation) {
  commands.build = {"mutants-no-such-program-anywhere"};
  auto dir = BuildDir::prepare(tree.getPath(), CopyConfig());
  ASSERT_TRUE(static_cast<bool>(dir)) << llvm::toString(dir.takeError());
  auto outcome = run(Scenario::mutant(makeHalfMutation(), 1, 1), dir->get());
  ASSERT_FALSE(static_cast<bool>(outcome));
  std::string message;
  EXPECT_EQ(takeErrorKind(outcome.takeError(), message), ErrorKind::Toolchain);
  EXPECT_FALSE((*dir)->hasMutation());
}

TEST(PhaseTimeoutsTest, SecondsToBudget) {
  EXPECT_EQ(secondsToBudget(0).count(), 0);
  EXPECT_EQ(secondsToBudget(-1).count(), 0);
  EXPECT_EQ(secondsToBudget(1.5).count(), 1500);
  EXPECT_EQ(secondsToBudget(0.0001).count(), 1);

  PhaseTimeouts timeouts;
  timeouts.build = std::chrono::milliseconds(7);
  EXPECT_EQ(timeouts.get(Phase::Build).count(), 7);
  EXPECT_EQ(timeouts.get(Phase::Test).count(), 0);
}

} // namespace
