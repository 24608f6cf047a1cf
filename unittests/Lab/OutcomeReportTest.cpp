//===- OutcomeReportTest.cpp - Unit tests for run reports -----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "LabTestUtils.h"
#include "mutants/Lab/OutcomeReport.h"
#include "gtest/gtest.h"

using namespace mutants;
using namespace mutants::test;

namespace {

class OutcomeReportTest : public ::testing::Test {
protected:
  void SetUp() override {
    Outcome baseline(Scenario::baseline(), "log/baseline.log");
    baseline.addPhase({Phase::Build, PhaseResult::Success, 2.0, 0});
    baseline.addPhase({Phase::Test, PhaseResult::Success, 1.0, 0});
    outcomes.push_back(std::move(baseline));

    addMutant("0", {PhaseResult::Success, PhaseResult::Failure});
    addMutant("1", {PhaseResult::Success, PhaseResult::Success});
    addMutant("-1", {PhaseResult::Failure});
    addMutant("2", {PhaseResult::Success, PhaseResult::Timeout});
  }

  void addMutant(llvm::StringRef replacement,
                 std::vector<PhaseResult> results) {
    unsigned ordinal = outcomes.size();
    Outcome outcome(Scenario::mutant(makeHalfMutation(replacement), ordinal, 4),
                    "log/mutant.log");
    Phase phase = Phase::Build;
    for (PhaseResult result : results) {
      outcome.addPhase({phase, result, 0.5, 0});
      phase = Phase::Test;
    }
    outcomes.push_back(std::move(outcome));
  }

  std::vector<Outcome> outcomes;
};

TEST_F(OutcomeReportTest, Summary) {
  RunSummary summary = RunSummary::summarize(outcomes);
  EXPECT_EQ(summary.caught, 1u);
  EXPECT_EQ(summary.missed, 1u);
  EXPECT_EQ(summary.unviable, 1u);
  EXPECT_EQ(summary.timeouts, 1u);
  EXPECT_EQ(summary.getTotal(), 4u);
}

TEST_F(OutcomeReportTest, OutcomesJSON) {
  llvm::json::Value value = outcomesToJSON(outcomes, /*interrupted=*/false);
  const llvm::json::Object *root = value.getAsObject();
  ASSERT_NE(root, nullptr);
  EXPECT_EQ(root->getInteger("total_mutants").getValueOr(0), 4);
  EXPECT_EQ(root->getInteger("caught").getValueOr(0), 1);
  EXPECT_EQ(root->getInteger("timeout").getValueOr(0), 1);
  EXPECT_EQ(root->getBoolean("interrupted").getValueOr(true), false);
  const llvm::json::Array *array = root->getArray("outcomes");
  ASSERT_NE(array, nullptr);
  ASSERT_EQ(array->size(), 5u);
  EXPECT_EQ((*array)[0].getAsObject()->getString("summary").getValueOr(""),
            "clean");
  EXPECT_EQ((*array)[2].getAsObject()->getString("summary").getValueOr(""),
            "missed");
}

TEST_F(OutcomeReportTest, JUnitXML) {
  std::string xml;
  llvm::raw_string_ostream os(xml);
  writeJUnitXML(os, outcomes, "mutants");
  os.flush();

  EXPECT_EQ(xml.find("<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"), 0u);
  EXPECT_NE(xml.find("<testsuites name=\"mutants\" tests=\"4\" failures=\"1\""
                     " errors=\"1\" skipped=\"1\""),
            std::string::npos);
  // One test case per mutant; the baseline is not a test case.
  size_t cases = 0;
  for (size_t pos = xml.find("<testcase"); pos != std::string::npos;
       pos = xml.find("<testcase", pos + 1))
    ++cases;
  EXPECT_EQ(cases, 4u);

  EXPECT_NE(xml.find("name=\"src/lib.rs:1:28: replace half -&gt; i64 with "
                     "0\" classname=\"src/lib.rs::half\" time=\"1.000\"/>"),
            std::string::npos);
  EXPECT_NE(xml.find("<failure type=\"missed\""), std::string::npos);
  EXPECT_NE(xml.find("<error type=\"timeout\""), std::string::npos);
  EXPECT_NE(xml.find("<skipped message="), std::string::npos);
  EXPECT_NE(xml.find("</testsuites>\n"), std::string::npos);
}

TEST_F(OutcomeReportTest, JUnitXMLFile) {
  TempTree tree;
  std::string path = tree.getPath("junit.xml");
  ASSERT_FALSE(
      static_cast<bool>(writeJUnitXMLFile(path, outcomes, "subject")));
  std::string xml = TempTree::readFile(path);
  EXPECT_NE(xml.find("<testsuite name=\"subject\""), std::string::npos);

  llvm::Error err = writeJUnitXMLFile(tree.getPath("missing/dir/junit.xml"),
                                      outcomes, "subject");
  EXPECT_TRUE(static_cast<bool>(err));
  llvm::consumeError(std::move(err));
}

} // namespace
