//===- OutputDir.cpp - The mutants.out result directory -------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutants/Lab/OutputDir.h"
#include "mutants/Lab/OutcomeReport.h"
#include "mutants/Support/MutantsError.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/ErrorHandling.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "mutants-lab"

using namespace mutants;
using llvm::StringRef;
namespace fs = llvm::sys::fs;

static llvm::Error outputError(const llvm::Twine &what, StringRef file,
                               std::error_code ec) {
  return makeError(ErrorKind::Isolation,
                   what + " " + file + ": " + ec.message());
}

/// Write \p text to \p file, replacing or appending to its contents.
static llvm::Error writeFile(StringRef file, StringRef text, bool append) {
  std::error_code ec;
  llvm::raw_fd_ostream os(file, ec,
                          append ? fs::OF_Append | fs::OF_Text : fs::OF_Text);
  if (ec)
    return outputError("cannot write", file, ec);
  os << text;
  os.close();
  if (os.has_error()) {
    std::error_code writeError = os.error();
    os.clear_error();
    return outputError("cannot write", file, writeError);
  }
  return llvm::Error::success();
}

llvm::StringRef mutants::getStatusListName(Status status) {
  switch (status) {
  case Status::Caught:
    return "caught.txt";
  case Status::Missed:
    return "missed.txt";
  case Status::Unviable:
    return "unviable.txt";
  case Status::Timeout:
    return "timeout.txt";
  }
  llvm_unreachable("unknown status");
}

llvm::Expected<std::unique_ptr<OutputDir>>
OutputDir::create(StringRef parent) {
  llvm::SmallString<256> path(parent);
  llvm::sys::path::append(path, "mutants.out");
  llvm::SmallString<256> old(parent);
  llvm::sys::path::append(old, "mutants.out.old");

  if (fs::exists(path)) {
    if (fs::exists(old))
      if (std::error_code ec = fs::remove_directories(old))
        return outputError("cannot remove", old, ec);
    if (std::error_code ec = fs::rename(path, old))
      return outputError("cannot rename", path, ec);
    LLVM_DEBUG(llvm::dbgs() << "moved previous results to " << old << "\n");
  }

  llvm::SmallString<256> logDir(path);
  llvm::sys::path::append(logDir, "log");
  if (std::error_code ec = fs::create_directories(logDir))
    return outputError("cannot create", logDir, ec);

  std::unique_ptr<OutputDir> dir(new OutputDir(path.str().str()));
  // Start each list empty so that appends describe this run only.
  for (Status status : {Status::Caught, Status::Missed, Status::Unviable,
                        Status::Timeout}) {
    llvm::SmallString<256> list(path);
    llvm::sys::path::append(list, getStatusListName(status));
    if (auto err = writeFile(list, "", /*append=*/false))
      return std::move(err);
  }
  return std::move(dir);
}

std::string OutputDir::getLogDirectory() const {
  llvm::SmallString<256> logDir(path);
  llvm::sys::path::append(logDir, "log");
  return logDir.str().str();
}

std::string OutputDir::getLogPath(const Scenario &scenario) const {
  llvm::SmallString<256> logPath(getLogDirectory());
  llvm::sys::path::append(logPath, scenario.getLogName() + ".log");
  return logPath.str().str();
}

llvm::Error
OutputDir::writeMutationList(llvm::ArrayRef<Mutation> mutations) const {
  llvm::json::Array array;
  for (const Mutation &mutation : mutations)
    array.push_back(mutation.toJSON());

  llvm::SmallString<256> file(path);
  llvm::sys::path::append(file, "mutants.json");
  std::string text =
      llvm::formatv("{0:2}", llvm::json::Value(std::move(array))).str();
  return writeFile(file, text + "\n", /*append=*/false);
}

llvm::Error OutputDir::addOutcome(const Outcome &outcome) const {
  const Mutation *mutation = outcome.getScenario().getMutation();
  if (!mutation)
    return llvm::Error::success();

  llvm::SmallString<256> list(path);
  llvm::sys::path::append(list, getStatusListName(outcome.getStatus()));
  return writeFile(list, mutation->getName() + "\n", /*append=*/true);
}

llvm::Error OutputDir::writeOutcomes(llvm::ArrayRef<Outcome> outcomes,
                                     bool interrupted) const {
  llvm::SmallString<256> file(path);
  llvm::sys::path::append(file, "outcomes.json");
  std::string text =
      llvm::formatv("{0:2}", outcomesToJSON(outcomes, interrupted)).str();
  return writeFile(file, text + "\n", /*append=*/false);
}
