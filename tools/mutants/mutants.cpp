//===- mutants.cpp - Mutation testing for Rust crates ---------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements the 'mutants' tool. It replaces function bodies of a
// Rust crate with plausible wrong values, one at a time, and reports every
// replacement the test suite fails to notice.
//
// Usage:
//   mutants -d path/to/crate
//   mutants --list --diff
//   mutants -j 4 --timeout 60 --re 'parser::' --junit mutants.xml
//
// Exit codes:
//   0    every viable mutant was caught
//   1    usage, configuration or toolchain failure
//   2    some mutants were not caught
//   3    some mutants timed out, none were missed
//   4    the source tree or the unmutated baseline is broken
//   130  interrupted
//
//===----------------------------------------------------------------------===//

#include "ConsoleReporter.h"
#include "mutants/Lab/Lab.h"
#include "mutants/Lab/OutcomeReport.h"
#include "mutants/Lab/OutputDir.h"
#include "mutants/Lab/Process.h"
#include "mutants/Mutation/Generator.h"
#include "mutants/Support/Diagnostics.h"
#include "mutants/Support/MutantsConfig.h"
#include "mutants/Support/MutantsError.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Signals.h"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"

#include <atomic>

namespace cl = llvm::cl;
using namespace mutants;

//===----------------------------------------------------------------------===//
// Command-line Options
//===----------------------------------------------------------------------===//

static cl::OptionCategory mainCategory("mutants Options");
static cl::OptionCategory commandCategory("Toolchain Options");
static cl::OptionCategory filterCategory("Filtering Options");
static cl::OptionCategory outputCategory("Output Options");

static cl::opt<std::string>
    directory("d", cl::desc("Directory of the crate to test"),
              cl::value_desc("dir"), cl::init("."), cl::cat(mainCategory));
static cl::alias directoryLong("dir", cl::desc("Alias for -d"),
                               cl::aliasopt(directory));

static cl::opt<std::string>
    configFile("config",
               cl::desc("Configuration file (default: .mutants.yaml or "
                        "mutants.yaml in the crate)"),
               cl::value_desc("file"), cl::cat(mainCategory));

static cl::opt<bool> listMutants("list",
                                 cl::desc("List mutants without testing them"),
                                 cl::cat(mainCategory));

static cl::opt<bool> listFiles("list-files",
                               cl::desc("List the files that would be mutated"),
                               cl::cat(mainCategory));

static cl::opt<bool> jsonOutput("json",
                                cl::desc("Print listings as JSON"),
                                cl::cat(mainCategory));

static cl::opt<bool> showDiff("diff",
                              cl::desc("Include a diff of each mutant in "
                                       "listings"),
                              cl::cat(mainCategory));

static cl::opt<unsigned> jobs("j",
                              cl::desc("Number of mutants to test in parallel "
                                       "(default: number of CPUs)"),
                              cl::value_desc("n"), cl::init(0),
                              cl::cat(mainCategory));
static cl::alias jobsLong("jobs", cl::desc("Alias for -j"),
                          cl::aliasopt(jobs));

static cl::opt<bool> noCheck("no-check",
                             cl::desc("Skip the check phase"),
                             cl::cat(commandCategory));

static cl::opt<std::string> checkCommand("check-cmd",
                                         cl::desc("Command for the check "
                                                  "phase"),
                                         cl::value_desc("command"),
                                         cl::cat(commandCategory));

static cl::opt<std::string> buildCommand("build-cmd",
                                         cl::desc("Command for the build "
                                                  "phase"),
                                         cl::value_desc("command"),
                                         cl::cat(commandCategory));

static cl::opt<std::string> testCommand("test-cmd",
                                        cl::desc("Command for the test phase"),
                                        cl::value_desc("command"),
                                        cl::cat(commandCategory));

static cl::opt<double>
    testTimeout("timeout",
                cl::desc("Test phase timeout in seconds (default: derived "
                         "from the baseline)"),
                cl::value_desc("seconds"), cl::cat(commandCategory));

static cl::opt<double> buildTimeout("build-timeout",
                                    cl::desc("Build phase timeout in seconds"),
                                    cl::value_desc("seconds"),
                                    cl::cat(commandCategory));

static cl::opt<double> checkTimeout("check-timeout",
                                    cl::desc("Check phase timeout in seconds"),
                                    cl::value_desc("seconds"),
                                    cl::cat(commandCategory));

static cl::list<std::string>
    includeFiles("file", cl::desc("Only mutate files matching this glob"),
                 cl::value_desc("glob"), cl::cat(filterCategory));

static cl::list<std::string>
    excludeFiles("exclude", cl::desc("Do not mutate files matching this glob"),
                 cl::value_desc("glob"), cl::cat(filterCategory));

static cl::list<std::string>
    includeFunctions("re",
                     cl::desc("Only test mutants whose name matches this "
                              "regex"),
                     cl::value_desc("regex"), cl::cat(filterCategory));

static cl::list<std::string>
    excludeFunctions("exclude-re",
                     cl::desc("Do not test mutants whose name matches this "
                              "regex"),
                     cl::value_desc("regex"), cl::cat(filterCategory));

static cl::opt<std::string>
    outputDirectory("output",
                    cl::desc("Directory to hold mutants.out (default: the "
                             "crate directory)"),
                    cl::value_desc("dir"), cl::cat(outputCategory));

static cl::opt<bool>
    testSourceTree("test-source-tree",
                   cl::desc("Build and test the source tree before copying it"),
                   cl::cat(mainCategory));

static cl::opt<bool> leaveCopies("leave-copies",
                                 cl::desc("Keep scratch copies after the run"),
                                 cl::cat(mainCategory));

static cl::opt<bool> caughtLogs("caught",
                                cl::desc("Print logs of caught mutants"),
                                cl::cat(outputCategory));

static cl::opt<bool> unviableLogs("unviable",
                                  cl::desc("Print logs of unviable mutants"),
                                  cl::cat(outputCategory));

static cl::opt<bool> allLogs("all-logs",
                             cl::desc("Print logs of every scenario"),
                             cl::cat(outputCategory));

static cl::opt<std::string> junitFile("junit",
                                      cl::desc("Write JUnit XML results"),
                                      cl::value_desc("file"),
                                      cl::cat(outputCategory));

static cl::opt<std::string> diagnosticsFormat(
    "diagnostics-format",
    cl::desc("Format of scan diagnostics (terminal, plain, json)"),
    cl::value_desc("format"), cl::init("terminal"), cl::cat(outputCategory));

//===----------------------------------------------------------------------===//
// Helper Functions
//===----------------------------------------------------------------------===//

enum ExitCode : int {
  ExitSuccess = 0,
  ExitUsage = 1,
  ExitFoundProblems = 2,
  ExitTimeouts = 3,
  ExitBaselineBroken = 4,
  ExitInterrupted = 130,
};

static std::atomic<bool> interruptRequested(false);

/// Runs in signal context. LLVM unregisters its handlers first, so a second
/// Ctrl-C terminates the tool at once.
static void handleInterrupt() { interruptRequested.store(true); }

/// Print \p err and return the matching exit code.
static int reportError(llvm::Error err) {
  std::string message;
  ErrorKind kind = takeErrorKind(std::move(err), message);
  llvm::WithColor::error(llvm::errs(), "mutants") << message << "\n";
  if (kind == ErrorKind::BaselineBroken)
    return ExitBaselineBroken;
  return ExitUsage;
}

static llvm::Expected<std::unique_ptr<MutantsConfig>> loadConfig() {
  if (!configFile.empty())
    return MutantsConfig::loadFromFile(configFile);
  return MutantsConfig::findAndLoad(directory);
}

/// Apply command-line options on top of the configuration file.
static void applyCommandLine(MutantsConfig &config) {
  CommandConfig &commands = config.getCommands();
  if (noCheck)
    commands.checkEnabled = false;
  if (checkCommand.getNumOccurrences())
    commands.check = splitCommandLine(checkCommand);
  if (buildCommand.getNumOccurrences())
    commands.build = splitCommandLine(buildCommand);
  if (testCommand.getNumOccurrences())
    commands.test = splitCommandLine(testCommand);

  TimeoutConfig &timeouts = config.getTimeouts();
  if (testTimeout.getNumOccurrences())
    timeouts.test = testTimeout;
  if (buildTimeout.getNumOccurrences())
    timeouts.build = buildTimeout;
  if (checkTimeout.getNumOccurrences())
    timeouts.check = checkTimeout;

  ScanConfig &scan = config.getScan();
  scan.includeFiles.insert(scan.includeFiles.end(), includeFiles.begin(),
                           includeFiles.end());
  scan.excludeFiles.insert(scan.excludeFiles.end(), excludeFiles.begin(),
                           excludeFiles.end());
  scan.includeFunctions.insert(scan.includeFunctions.end(),
                               includeFunctions.begin(),
                               includeFunctions.end());
  scan.excludeFunctions.insert(scan.excludeFunctions.end(),
                               excludeFunctions.begin(),
                               excludeFunctions.end());

  if (jobs.getNumOccurrences())
    config.setJobs(jobs);
  if (!outputDirectory.empty())
    config.setOutputDirectory(outputDirectory);
  if (testSourceTree)
    config.setTestSourceTree(true);
  if (leaveCopies)
    config.setLeaveCopies(true);
}

static void printScanProblems(const Discovery &discovery,
                              DiagnosticOutputFormat format) {
  if (discovery.problems.empty())
    return;
  DiagnosticPrinter printer(llvm::errs(), format);
  for (const ScanProblem &problem : discovery.problems) {
    printer.addSourceText(problem.file, problem.sourceText);
    printer.print(problem.diagnostic);
  }
  printer.flush();
}

/// Return the diff of \p mutation against the file in the crate.
static std::string getDiffInCrate(const Mutation &mutation) {
  llvm::SmallString<256> path(directory);
  llvm::sys::path::append(path, llvm::sys::path::Style::posix,
                          mutation.getFile());
  llvm::sys::path::native(path);
  auto buffer = llvm::MemoryBuffer::getFile(path);
  if (!buffer)
    return "";
  return mutation.getUnifiedDiff((*buffer)->getBuffer());
}

static int runListFiles(const Discovery &discovery) {
  if (jsonOutput) {
    llvm::json::Array files;
    for (const std::string &file : discovery.files)
      files.push_back(file);
    llvm::outs() << llvm::formatv("{0:2}", llvm::json::Value(std::move(files)))
                 << "\n";
    return ExitSuccess;
  }
  for (const std::string &file : discovery.files)
    llvm::outs() << file << "\n";
  return ExitSuccess;
}

static int runList(const Discovery &discovery) {
  if (jsonOutput) {
    llvm::json::Array array;
    for (const Mutation &mutation : discovery.mutations) {
      llvm::json::Object object = mutation.toJSON();
      if (showDiff)
        object["diff"] = getDiffInCrate(mutation);
      array.push_back(std::move(object));
    }
    llvm::outs() << llvm::formatv("{0:2}", llvm::json::Value(std::move(array)))
                 << "\n";
    return ExitSuccess;
  }
  for (const Mutation &mutation : discovery.mutations) {
    llvm::outs() << mutation.getName() << "\n";
    if (showDiff)
      llvm::outs() << getDiffInCrate(mutation);
  }
  return ExitSuccess;
}

static int getExitCode(const RunResult &result) {
  if (result.interrupted)
    return ExitInterrupted;
  if (result.summary.missed)
    return ExitFoundProblems;
  if (result.summary.timeouts)
    return ExitTimeouts;
  return ExitSuccess;
}

static int runMutants(const MutantsConfig &config,
                      const Discovery &discovery) {
  becomeChildSubreaper();
  llvm::sys::SetInterruptFunction(handleInterrupt);

  std::string parent = config.getOutputDirectory().empty()
                           ? directory.getValue()
                           : config.getOutputDirectory().str();
  auto output = OutputDir::create(parent);
  if (!output)
    return reportError(output.takeError());

  LogSelection logs;
  logs.caught = caughtLogs;
  logs.unviable = unviableLogs;
  logs.all = allLogs;
  ConsoleReporter reporter(llvm::outs(), logs);
  reporter.addWarnings(discovery.warnings);

  // The reporter has printed the summary and warnings of whatever ran by the
  // time run() returns, whether or not the run failed.
  Lab lab(config, directory, **output, reporter, interruptRequested);
  RunResult result;
  llvm::Error runErr = lab.run(discovery.mutations, result);

  if (!junitFile.empty())
    if (auto err = writeJUnitXMLFile(junitFile, result.outcomes, "mutants")) {
      if (runErr)
        return reportError(llvm::joinErrors(std::move(runErr), std::move(err)));
      return reportError(std::move(err));
    }

  if (runErr) {
    if (interruptRequested.load()) {
      llvm::consumeError(std::move(runErr));
      return ExitInterrupted;
    }
    return reportError(std::move(runErr));
  }
  return getExitCode(result);
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main(int argc, char **argv) {
  llvm::InitLLVM y(argc, argv);

  cl::HideUnrelatedOptions(
      {&mainCategory, &commandCategory, &filterCategory, &outputCategory});
  cl::ParseCommandLineOptions(argc, argv, "Mutation testing for Rust crates\n");

  auto format = parseDiagnosticOutputFormat(diagnosticsFormat);
  if (!format) {
    llvm::WithColor::error(llvm::errs(), "mutants")
        << "unknown diagnostics format '" << diagnosticsFormat << "'\n";
    return ExitUsage;
  }

  auto config = loadConfig();
  if (!config)
    return reportError(config.takeError());
  applyCommandLine(**config);
  if (auto err = (*config)->validate())
    return reportError(std::move(err));

  auto discovery = discoverMutations(directory, **config);
  if (!discovery)
    return reportError(discovery.takeError());
  printScanProblems(*discovery, *format);

  if (listFiles)
    return runListFiles(*discovery);
  if (listMutants)
    return runList(*discovery);
  return runMutants(**config, *discovery);
}
