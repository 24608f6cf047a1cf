//===- OutcomeReport.cpp - Machine-readable run reports -------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutants/Lab/OutcomeReport.h"
#include "mutants/Support/MutantsError.h"

#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/Format.h"

using namespace mutants;

void RunSummary::add(Status status) {
  switch (status) {
  case Status::Caught:
    ++caught;
    return;
  case Status::Missed:
    ++missed;
    return;
  case Status::Unviable:
    ++unviable;
    return;
  case Status::Timeout:
    ++timeouts;
    return;
  }
  llvm_unreachable("unknown status");
}

RunSummary RunSummary::summarize(llvm::ArrayRef<Outcome> outcomes) {
  RunSummary summary;
  for (const Outcome &outcome : outcomes)
    if (outcome.getScenario().isMutant())
      summary.add(outcome.getStatus());
  return summary;
}

llvm::json::Object RunSummary::toJSON() const {
  return llvm::json::Object{{"total_mutants", int64_t(getTotal())},
                            {"caught", int64_t(caught)},
                            {"missed", int64_t(missed)},
                            {"unviable", int64_t(unviable)},
                            {"timeout", int64_t(timeouts)}};
}

llvm::json::Value mutants::outcomesToJSON(llvm::ArrayRef<Outcome> outcomes,
                                          bool interrupted) {
  llvm::json::Array array;
  for (const Outcome &outcome : outcomes)
    array.push_back(outcome.toJSON());

  llvm::json::Object root = RunSummary::summarize(outcomes).toJSON();
  root["interrupted"] = interrupted;
  root["outcomes"] = std::move(array);
  return llvm::json::Value(std::move(root));
}

//===----------------------------------------------------------------------===//
// JUnit XML Writer
//===----------------------------------------------------------------------===//

namespace {

/// Escape special characters for XML output.
std::string escapeXML(llvm::StringRef str) {
  std::string result;
  result.reserve(str.size());
  for (char c : str) {
    switch (c) {
    case '&':
      result += "&amp;";
      break;
    case '<':
      result += "&lt;";
      break;
    case '>':
      result += "&gt;";
      break;
    case '"':
      result += "&quot;";
      break;
    case '\'':
      result += "&apos;";
      break;
    default:
      // Drop control characters other than common whitespace.
      if (static_cast<unsigned char>(c) >= 0x20 || c == '\n' || c == '\r' ||
          c == '\t')
        result += c;
      break;
    }
  }
  return result;
}

std::string formatTime(double seconds) {
  std::string result;
  llvm::raw_string_ostream os(result);
  os << llvm::format("%.3f", seconds);
  return os.str();
}

/// The test case class name: the mutated function qualified by its file.
std::string getClassName(const Mutation &mutation) {
  return (mutation.getFile() + "::" + mutation.getFunctionName()).str();
}

} // namespace

void mutants::writeJUnitXML(llvm::raw_ostream &os,
                            llvm::ArrayRef<Outcome> outcomes,
                            llvm::StringRef suiteName) {
  RunSummary summary = RunSummary::summarize(outcomes);
  double totalTime = 0;
  for (const Outcome &outcome : outcomes)
    if (outcome.getScenario().isMutant())
      totalTime += outcome.getTotalSeconds();

  os << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
  os << "<testsuites name=\"" << escapeXML(suiteName) << "\"";
  os << " tests=\"" << summary.getTotal() << "\"";
  os << " failures=\"" << summary.missed << "\"";
  os << " errors=\"" << summary.timeouts << "\"";
  os << " skipped=\"" << summary.unviable << "\"";
  os << " time=\"" << formatTime(totalTime) << "\">\n";

  os << "  <testsuite name=\"" << escapeXML(suiteName) << "\"";
  os << " tests=\"" << summary.getTotal() << "\"";
  os << " failures=\"" << summary.missed << "\"";
  os << " errors=\"" << summary.timeouts << "\"";
  os << " skipped=\"" << summary.unviable << "\"";
  os << " time=\"" << formatTime(totalTime) << "\">\n";

  for (const Outcome &outcome : outcomes) {
    const Mutation *mutation = outcome.getScenario().getMutation();
    if (!mutation)
      continue;

    os << "    <testcase";
    os << " name=\"" << escapeXML(mutation->getName()) << "\"";
    os << " classname=\"" << escapeXML(getClassName(*mutation)) << "\"";
    os << " time=\"" << formatTime(outcome.getTotalSeconds()) << "\"";

    Status status = outcome.getStatus();
    if (status == Status::Caught) {
      os << "/>\n";
      continue;
    }
    os << ">\n";
    switch (status) {
    case Status::Missed:
      os << "      <failure type=\"missed\" message=\"mutant was not caught"
         << " by any test\">" << escapeXML(outcome.getLogPath())
         << "</failure>\n";
      break;
    case Status::Timeout:
      os << "      <error type=\"timeout\" message=\"test phase exceeded its"
         << " timeout\">" << escapeXML(outcome.getLogPath()) << "</error>\n";
      break;
    case Status::Unviable:
      os << "      <skipped message=\"mutant does not build\"/>\n";
      break;
    case Status::Caught:
      llvm_unreachable("caught mutants have no child element");
    }
    os << "    </testcase>\n";
  }

  os << "  </testsuite>\n";
  os << "</testsuites>\n";
}

llvm::Error mutants::writeJUnitXMLFile(llvm::StringRef path,
                                       llvm::ArrayRef<Outcome> outcomes,
                                       llvm::StringRef suiteName) {
  std::error_code ec;
  llvm::raw_fd_ostream os(path, ec, llvm::sys::fs::OF_Text);
  if (ec)
    return makeError(ErrorKind::Isolation,
                     "cannot write " + path + ": " + ec.message());
  writeJUnitXML(os, outcomes, suiteName);
  os.close();
  if (os.has_error()) {
    std::error_code writeError = os.error();
    os.clear_error();
    return makeError(ErrorKind::Isolation,
                     "cannot write " + path + ": " + writeError.message());
  }
  return llvm::Error::success();
}
