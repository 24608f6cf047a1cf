//===- ConsoleReporter.cpp - Terminal output for mutation runs ------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "ConsoleReporter.h"

#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/WithColor.h"

using namespace mutants;
using llvm::StringRef;

ConsoleReporter::ConsoleReporter(llvm::raw_ostream &os, LogSelection logs)
    : os(os), logs(logs), useColors(os.has_colors()),
      showProgress(os.is_displayed()),
      start(std::chrono::steady_clock::now()), lastStatus(start) {}

void ConsoleReporter::addWarnings(llvm::ArrayRef<std::string> more) {
  warnings.insert(warnings.end(), more.begin(), more.end());
}

void ConsoleReporter::clearStatus() {
  if (!statusShown)
    return;
  os << "\r\x1b[K";
  statusShown = false;
}

void ConsoleReporter::copyStarted(StringRef sourceRoot) {
  clearStatus();
  os << "Copy source to scratch directory ... ";
  os.flush();
}

void ConsoleReporter::copyFinished(uint64_t bytes, double seconds) {
  os << "done\n";
  os.flush();
}

void ConsoleReporter::scenarioStarted(const Scenario &scenario) {}

void ConsoleReporter::scenarioTick(const Scenario &scenario, Phase phase,
                                   double elapsedSeconds) {
  if (!showProgress)
    return;
  auto now = std::chrono::steady_clock::now();
  if (now - lastStatus < std::chrono::milliseconds(100))
    return;
  lastStatus = now;

  os << "\r\x1b[K";
  if (scenario.isMutant())
    os << scenario.getOrdinal() << "/" << scenario.getTotal() << " ";
  os << scenario.describe() << " ... " << getPhaseName(phase) << " "
     << llvm::format("%.1f", elapsedSeconds) << "s";
  os.flush();
  statusShown = true;
}

void ConsoleReporter::printLabel(const Outcome &outcome) {
  StringRef label;
  llvm::raw_ostream::Colors color = llvm::raw_ostream::SAVEDCOLOR;
  if (outcome.getScenario().isMutant()) {
    switch (outcome.getStatus()) {
    case Status::Caught:
      label = "caught";
      color = llvm::raw_ostream::GREEN;
      break;
    case Status::Missed:
      label = "NOT CAUGHT";
      color = llvm::raw_ostream::RED;
      break;
    case Status::Timeout:
      label = "TIMEOUT";
      color = llvm::raw_ostream::YELLOW;
      break;
    case Status::Unviable:
      label = "unviable";
      color = llvm::raw_ostream::BLUE;
      break;
    }
  } else {
    switch (outcome.getGateVerdict()) {
    case GateVerdict::Clean:
      label = "ok";
      color = llvm::raw_ostream::GREEN;
      break;
    case GateVerdict::Broken:
      label = "FAILED";
      color = llvm::raw_ostream::RED;
      break;
    case GateVerdict::Slow:
      label = "TIMEOUT";
      color = llvm::raw_ostream::RED;
      break;
    }
  }
  llvm::WithColor(os, color, /*Bold=*/true,
                  /*BG=*/false,
                  useColors ? llvm::ColorMode::Enable
                            : llvm::ColorMode::Disable)
      << label;
}

bool ConsoleReporter::shouldPrintLog(const Outcome &outcome) const {
  if (logs.all)
    return true;
  if (!outcome.getScenario().isMutant())
    return outcome.getGateVerdict() != GateVerdict::Clean;
  switch (outcome.getStatus()) {
  case Status::Caught:
    return logs.caught;
  case Status::Unviable:
    return logs.unviable;
  case Status::Missed:
  case Status::Timeout:
    return false;
  }
  return false;
}

void ConsoleReporter::printLog(const Outcome &outcome) {
  auto text = outcome.readLog();
  if (!text) {
    llvm::WithColor::warning(os, "mutants", !useColors)
        << llvm::toString(text.takeError()) << "\n";
    return;
  }
  os << *text;
  if (!StringRef(*text).endswith("\n"))
    os << "\n";
}

void ConsoleReporter::scenarioFinished(const Outcome &outcome) {
  clearStatus();
  os << outcome.getScenario().describe() << " ... ";
  printLabel(outcome);
  os << " in " << llvm::format("%.3f", outcome.getTotalSeconds()) << "s\n";
  if (!outcome.getError().empty())
    os << "  " << outcome.getError() << "\n";
  if (shouldPrintLog(outcome))
    printLog(outcome);
  os.flush();
}

std::string ConsoleReporter::formatSummary(const RunSummary &summary,
                                           double seconds) {
  std::string out;
  llvm::raw_string_ostream line(out);
  unsigned total = summary.getTotal();
  line << total << (total == 1 ? " mutant" : " mutants") << " tested in "
       << llvm::format("%.3f", seconds) << "s";

  llvm::SmallVector<std::string, 4> parts;
  if (summary.missed)
    parts.push_back(llvm::utostr(summary.missed) + " missed");
  if (summary.caught)
    parts.push_back(llvm::utostr(summary.caught) + " caught");
  if (summary.unviable)
    parts.push_back(llvm::utostr(summary.unviable) + " unviable");
  if (summary.timeouts)
    parts.push_back(llvm::utostr(summary.timeouts) +
                    (summary.timeouts == 1 ? " timeout" : " timeouts"));
  if (!parts.empty())
    line << ": " << llvm::join(parts, ", ");
  return line.str();
}

void ConsoleReporter::runFinished(const RunResult &result) {
  clearStatus();
  std::chrono::duration<double> elapsed =
      std::chrono::steady_clock::now() - start;
  if (result.interrupted)
    llvm::WithColor::warning(os, "mutants", !useColors) << "run interrupted\n";
  os << formatSummary(result.summary, elapsed.count()) << "\n";

  addWarnings(result.warnings);
  for (const std::string &warning : warnings)
    llvm::WithColor::warning(os, "mutants", !useColors) << warning << "\n";
  os.flush();
}
