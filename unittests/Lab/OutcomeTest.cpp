//===- OutcomeTest.cpp - Unit tests for scenarios and outcomes ------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "LabTestUtils.h"
#include "mutants/Lab/Outcome.h"
#include "mutants/Lab/Scenario.h"
#include "gtest/gtest.h"

using namespace mutants;
using namespace mutants::test;

namespace {

PhaseRecord record(Phase phase, PhaseResult result, double seconds = 1) {
  PhaseRecord r;
  r.phase = phase;
  r.result = result;
  r.seconds = seconds;
  r.exitCode = result == PhaseResult::Failure ? 101 : 0;
  return r;
}

constexpr PhaseResult Ok = PhaseResult::Success;
constexpr PhaseResult Fail = PhaseResult::Failure;
constexpr PhaseResult Slow = PhaseResult::Timeout;

//===----------------------------------------------------------------------===//
// Scenario
//===----------------------------------------------------------------------===//

TEST(ScenarioTest, Descriptions) {
  EXPECT_EQ(Scenario::sourceTree().describe(), "Source tree");
  EXPECT_EQ(Scenario::baseline().describe(), "Unmutated baseline");
  Scenario mutant = Scenario::mutant(makeHalfMutation(), 7, 12);
  EXPECT_EQ(mutant.describe(), "src/lib.rs:1:28: replace half -> i64 with 0");
  EXPECT_TRUE(mutant.isMutant());
  EXPECT_EQ(mutant.getOrdinal(), 7u);
  EXPECT_EQ(mutant.getTotal(), 12u);
  ASSERT_NE(mutant.getMutation(), nullptr);
  EXPECT_EQ(Scenario::baseline().getMutation(), nullptr);
}

TEST(ScenarioTest, LogNames) {
  EXPECT_EQ(Scenario::sourceTree().getLogName(), "source_tree");
  EXPECT_EQ(Scenario::baseline().getLogName(), "baseline");
  EXPECT_EQ(Scenario::mutant(makeHalfMutation(), 7, 12).getLogName(),
            "0007-src__lib.rs_1_28");
}

//===----------------------------------------------------------------------===//
// Classification
//===----------------------------------------------------------------------===//

TEST(OutcomeTest, ClassifyMutant) {
  EXPECT_EQ(classifyMutant({}), Status::Unviable);
  EXPECT_EQ(classifyMutant({record(Phase::Check, Fail)}), Status::Unviable);
  EXPECT_EQ(classifyMutant({record(Phase::Check, Slow)}), Status::Unviable);
  EXPECT_EQ(classifyMutant({record(Phase::Check, Ok),
                            record(Phase::Build, Fail)}),
            Status::Unviable);
  EXPECT_EQ(classifyMutant({record(Phase::Build, Ok),
                            record(Phase::Test, Fail)}),
            Status::Caught);
  EXPECT_EQ(classifyMutant({record(Phase::Check, Ok),
                            record(Phase::Build, Ok),
                            record(Phase::Test, Ok)}),
            Status::Missed);
  EXPECT_EQ(classifyMutant({record(Phase::Build, Ok),
                            record(Phase::Test, Slow)}),
            Status::Timeout);
}

TEST(OutcomeTest, StoppedAfterBuildIsTimeout) {
  EXPECT_EQ(classifyMutant({record(Phase::Check, Ok),
                            record(Phase::Build, Ok)}),
            Status::Timeout);
}

TEST(OutcomeTest, ClassifyGate) {
  EXPECT_EQ(classifyGate({}, Phase::Test), GateVerdict::Broken);
  EXPECT_EQ(classifyGate({record(Phase::Build, Ok), record(Phase::Test, Ok)},
                         Phase::Test),
            GateVerdict::Clean);
  EXPECT_EQ(classifyGate({record(Phase::Build, Ok),
                          record(Phase::Test, Fail)},
                         Phase::Test),
            GateVerdict::Broken);
  EXPECT_EQ(classifyGate({record(Phase::Build, Slow)}, Phase::Test),
            GateVerdict::Slow);
  EXPECT_EQ(classifyGate({record(Phase::Build, Ok)}, Phase::Test),
            GateVerdict::Broken);
}

TEST(OutcomeTest, Names) {
  EXPECT_EQ(getPhaseName(Phase::Check), "check");
  EXPECT_EQ(getPhaseResultName(PhaseResult::Timeout), "timeout");
  EXPECT_EQ(getStatusName(Status::Missed), "missed");
  EXPECT_EQ(getGateVerdictName(GateVerdict::Slow), "slow");
}

//===----------------------------------------------------------------------===//
// Outcome
//===----------------------------------------------------------------------===//

TEST(OutcomeTest, Durations) {
  Outcome outcome(Scenario::baseline(), "log/baseline.log");
  outcome.addPhase(record(Phase::Build, Ok, 2.5));
  outcome.addPhase(record(Phase::Test, Ok, 1.25));
  EXPECT_EQ(outcome.getGateVerdict(), GateVerdict::Clean);
  EXPECT_DOUBLE_EQ(outcome.getTotalSeconds(), 3.75);
  EXPECT_FALSE(outcome.getPhaseSeconds(Phase::Check).has_value());
  ASSERT_TRUE(outcome.getPhaseSeconds(Phase::Build).has_value());
  EXPECT_DOUBLE_EQ(*outcome.getPhaseSeconds(Phase::Build), 2.5);
}

TEST(OutcomeTest, ToJSON) {
  Outcome outcome(Scenario::mutant(makeHalfMutation(), 3, 3),
                  "log/0003-src__lib.rs_1_28.log");
  outcome.addPhase(record(Phase::Build, Ok, 2));
  outcome.addPhase(record(Phase::Test, Fail, 1));

  llvm::json::Object json = outcome.toJSON();
  EXPECT_EQ(json.getString("scenario").getValueOr(""), "mutant");
  EXPECT_EQ(json.getString("summary").getValueOr(""), "caught");
  EXPECT_EQ(json.getInteger("ordinal").getValueOr(0), 3);
  EXPECT_EQ(json.getString("log_path").getValueOr(""),
            "log/0003-src__lib.rs_1_28.log");
  ASSERT_NE(json.getObject("mutation"), nullptr);
  EXPECT_EQ(json.getObject("mutation")->getString("replacement").getValueOr(""),
            "0");

  const llvm::json::Array *phases = json.getArray("phase_results");
  ASSERT_NE(phases, nullptr);
  ASSERT_EQ(phases->size(), 2u);
  const llvm::json::Object *test = (*phases)[1].getAsObject();
  ASSERT_NE(test, nullptr);
  EXPECT_EQ(test->getString("phase").getValueOr(""), "test");
  EXPECT_EQ(test->getString("result").getValueOr(""), "failure");
  EXPECT_EQ(test->getInteger("exit_code").getValueOr(0), 101);
  EXPECT_EQ(json.get("error"), nullptr);
}

TEST(OutcomeTest, ErrorWithoutPhases) {
  Outcome outcome(Scenario::mutant(makeHalfMutation(), 1, 1), "log/x.log");
  outcome.setError("cannot write src/lib.rs");
  EXPECT_EQ(outcome.getStatus(), Status::Unviable);
  EXPECT_EQ(outcome.toJSON().getString("error").getValueOr(""),
            "cannot write src/lib.rs");
}

TEST(OutcomeTest, ReadLog) {
  TempTree tree;
  tree.write("scenario.log", "$ cargo test\nok\n");
  Outcome outcome(Scenario::baseline(), tree.getPath("scenario.log"));
  auto log = outcome.readLog();
  ASSERT_TRUE(static_cast<bool>(log)) << llvm::toString(log.takeError());
  EXPECT_EQ(*log, "$ cargo test\nok\n");

  Outcome missing(Scenario::baseline(), tree.getPath("missing.log"));
  auto none = missing.readLog();
  ASSERT_FALSE(static_cast<bool>(none));
  llvm::consumeError(none.takeError());
}

} // namespace
