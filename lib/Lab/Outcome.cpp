//===- Outcome.cpp - Results of one scenario ------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutants/Lab/Outcome.h"
#include "mutants/Support/MutantsError.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/MemoryBuffer.h"

#include <cassert>

using namespace mutants;

llvm::StringRef mutants::getPhaseName(Phase phase) {
  switch (phase) {
  case Phase::Check:
    return "check";
  case Phase::Build:
    return "build";
  case Phase::Test:
    return "test";
  }
  llvm_unreachable("unknown phase");
}

llvm::StringRef mutants::getPhaseResultName(PhaseResult result) {
  switch (result) {
  case PhaseResult::Success:
    return "success";
  case PhaseResult::Failure:
    return "failure";
  case PhaseResult::Timeout:
    return "timeout";
  }
  llvm_unreachable("unknown phase result");
}

llvm::StringRef mutants::getStatusName(Status status) {
  switch (status) {
  case Status::Caught:
    return "caught";
  case Status::Missed:
    return "missed";
  case Status::Unviable:
    return "unviable";
  case Status::Timeout:
    return "timeout";
  }
  llvm_unreachable("unknown status");
}

llvm::StringRef mutants::getGateVerdictName(GateVerdict verdict) {
  switch (verdict) {
  case GateVerdict::Clean:
    return "clean";
  case GateVerdict::Broken:
    return "broken";
  case GateVerdict::Slow:
    return "slow";
  }
  llvm_unreachable("unknown gate verdict");
}

Status mutants::classifyMutant(llvm::ArrayRef<PhaseRecord> phases) {
  if (phases.empty())
    return Status::Unviable;
  const PhaseRecord &last = phases.back();
  // A pipeline stopped after a successful Check or Build was cancelled, which
  // counts as a timeout.
  if (last.phase != Phase::Test)
    return last.result == PhaseResult::Success ? Status::Timeout
                                               : Status::Unviable;
  switch (last.result) {
  case PhaseResult::Success:
    return Status::Missed;
  case PhaseResult::Failure:
    return Status::Caught;
  case PhaseResult::Timeout:
    return Status::Timeout;
  }
  llvm_unreachable("unknown phase result");
}

GateVerdict mutants::classifyGate(llvm::ArrayRef<PhaseRecord> phases,
                                  Phase finalPhase) {
  if (phases.empty())
    return GateVerdict::Broken;
  const PhaseRecord &last = phases.back();
  switch (last.result) {
  case PhaseResult::Success:
    return last.phase == finalPhase ? GateVerdict::Clean : GateVerdict::Broken;
  case PhaseResult::Failure:
    return GateVerdict::Broken;
  case PhaseResult::Timeout:
    return GateVerdict::Slow;
  }
  llvm_unreachable("unknown phase result");
}

void Outcome::addPhase(const PhaseRecord &record) {
  assert((phases.empty() ||
          (phases.back().result == PhaseResult::Success &&
           static_cast<int>(phases.back().phase) <
               static_cast<int>(record.phase))) &&
         "phases must follow pipeline order and stop at the first failure");
  phases.push_back(record);
}

std::optional<double> Outcome::getPhaseSeconds(Phase phase) const {
  for (const PhaseRecord &record : phases)
    if (record.phase == phase)
      return record.seconds;
  return std::nullopt;
}

double Outcome::getTotalSeconds() const {
  double total = 0;
  for (const PhaseRecord &record : phases)
    total += record.seconds;
  return total;
}

llvm::Expected<std::string> Outcome::readLog() const {
  auto buffer = llvm::MemoryBuffer::getFile(logPath, /*IsText=*/true,
                                            /*RequiresNullTerminator=*/false);
  if (!buffer)
    return makeError(ErrorKind::Isolation, "cannot read log " + logPath +
                                               ": " +
                                               buffer.getError().message());
  return (*buffer)->getBuffer().str();
}

llvm::json::Object Outcome::toJSON() const {
  llvm::json::Object object;
  object["scenario"] = getScenarioKindName(scenario.getKind());
  if (const Mutation *mutation = scenario.getMutation()) {
    object["ordinal"] = static_cast<int64_t>(scenario.getOrdinal());
    object["mutation"] = mutation->toJSON();
    object["summary"] = getStatusName(getStatus());
  } else {
    object["summary"] = getGateVerdictName(getGateVerdict());
  }
  object["log_path"] = logPath;

  llvm::json::Array phaseArray;
  for (const PhaseRecord &record : phases)
    phaseArray.push_back(llvm::json::Object{
        {"phase", getPhaseName(record.phase)},
        {"result", getPhaseResultName(record.result)},
        {"duration", record.seconds},
        {"exit_code", static_cast<int64_t>(record.exitCode)},
    });
  object["phase_results"] = std::move(phaseArray);
  if (!error.empty())
    object["error"] = error;
  return object;
}
