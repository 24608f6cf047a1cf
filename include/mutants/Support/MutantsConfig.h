//===- MutantsConfig.h - Run configuration ----------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file declares the MutantsConfig class, which holds everything a run
// needs to know about the subject tree: the toolchain commands, timeouts,
// which files and functions to mutate, what not to copy, and how to sanitize
// the environment. It can be loaded from an optional YAML file in the subject
// root (.mutants.yaml or mutants.yaml) and is then overridden from the
// command line.
//
// Example configuration:
//
// ```yaml
// commands:
//   check: "cargo check --tests"
//   build: ["cargo", "build", "--tests"]
//   test: "cargo test --workspace"
//   check_enabled: true
//
// timeouts:
//   test: 0          # automatic
//   minimum: 20
//   multiplier: 5
//
// scan:
//   source_dirs: ["src"]
//   exclude_files: ["src/generated/*.rs"]
//   exclude_functions: ["::fmt$"]
//   skip_attributes: ["test", "cfg(test)", "mutants::skip"]
//
// copy:
//   exclude: ["target", ".git"]
//
// environment:
//   remove: ["CARGO_TARGET_DIR"]
//   set: ["RUST_BACKTRACE=0"]
//
// jobs: 4
// leave_copies: false
// ```
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_SUPPORT_MUTANTSCONFIG_H
#define MUTANTS_SUPPORT_MUTANTSCONFIG_H

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mutants {

//===----------------------------------------------------------------------===//
// Sections
//===----------------------------------------------------------------------===//

/// The external toolchain. Each command is an argv vector; the first element
/// is looked up on PATH.
struct CommandConfig {
  std::vector<std::string> check = {"cargo", "check", "--tests"};
  std::vector<std::string> build = {"cargo", "build", "--tests"};
  std::vector<std::string> test = {"cargo", "test"};

  /// Whether the Check phase runs before Build.
  bool checkEnabled = true;
};

/// Phase timeouts in seconds. A zero phase timeout means "derive it from the
/// baseline".
struct TimeoutConfig {
  double check = 0;
  double build = 0;
  double test = 0;

  /// Lower bound for derived timeouts.
  double minimum = 20;

  /// Derived timeout = multiplier * baseline duration of the phase.
  double multiplier = 5;

  /// Used for SourceTree and Baseline phases that have no explicit value.
  double baseline = 3600;
};

/// Which files and functions are considered for mutation.
struct ScanConfig {
  /// Directories, relative to the subject root, that are searched for .rs
  /// files.
  std::vector<std::string> sourceDirs = {"src"};

  /// Glob patterns over root-relative paths. An empty include list accepts
  /// every file.
  std::vector<std::string> includeFiles;
  std::vector<std::string> excludeFiles;

  /// Regexes matched against mutation names (which contain the qualified
  /// function name).
  std::vector<std::string> includeFunctions;
  std::vector<std::string> excludeFunctions;

  /// Attributes that exclude the item they decorate. An entry matches the
  /// attribute text exactly or as a prefix followed by '('.
  std::vector<std::string> skipAttributes = {"test", "cfg(test)",
                                             "mutants::skip"};

  /// A file containing one of these strings near its top is not scanned.
  std::vector<std::string> generatedMarkers = {"@generated"};
};

struct CopyConfig {
  /// Directory names that are never copied into a scratch tree.
  std::vector<std::string> exclude = {
      "target", ".git", ".hg", ".svn", "_darcs", ".jj", "mutants.out",
      "mutants.out.old"};
};

struct EnvironmentConfig {
  /// Variables removed from the inherited environment.
  std::vector<std::string> remove = {"CARGO_TARGET_DIR",
                                     "CARGO_BUILD_TARGET_DIR"};

  /// NAME=VALUE entries added to the environment.
  std::vector<std::string> set;
};

//===----------------------------------------------------------------------===//
// MutantsConfig
//===----------------------------------------------------------------------===//

class MutantsConfig {
public:
  MutantsConfig();
  ~MutantsConfig();

  /// Load configuration from a YAML file. Unknown keys are ignored; values of
  /// the wrong shape are errors.
  static llvm::Expected<std::unique_ptr<MutantsConfig>>
  loadFromFile(llvm::StringRef filePath);

  /// Load configuration from a YAML string.
  static llvm::Expected<std::unique_ptr<MutantsConfig>>
  loadFromYAML(llvm::StringRef yamlContent);

  /// Load the first configuration file found in \p directory, or return the
  /// default configuration if there is none.
  static llvm::Expected<std::unique_ptr<MutantsConfig>>
  findAndLoad(llvm::StringRef directory);

  CommandConfig &getCommands() { return commands; }
  const CommandConfig &getCommands() const { return commands; }

  TimeoutConfig &getTimeouts() { return timeouts; }
  const TimeoutConfig &getTimeouts() const { return timeouts; }

  ScanConfig &getScan() { return scan; }
  const ScanConfig &getScan() const { return scan; }

  CopyConfig &getCopy() { return copy; }
  const CopyConfig &getCopy() const { return copy; }

  EnvironmentConfig &getEnvironment() { return environment; }
  const EnvironmentConfig &getEnvironment() const { return environment; }

  /// Number of parallel workers; zero means hardware concurrency.
  unsigned getJobs() const { return jobs; }
  void setJobs(unsigned n) { jobs = n; }

  /// Return the effective worker count (never zero).
  unsigned getEffectiveJobs() const;

  /// Directory that receives mutants.out. Empty means the subject root.
  llvm::StringRef getOutputDirectory() const { return outputDirectory; }
  void setOutputDirectory(llvm::StringRef dir) { outputDirectory = dir.str(); }

  bool getTestSourceTree() const { return testSourceTree; }
  void setTestSourceTree(bool enable) { testSourceTree = enable; }

  bool getLeaveCopies() const { return leaveCopies; }
  void setLeaveCopies(bool enable) { leaveCopies = enable; }

  /// The file the configuration was loaded from, if any.
  llvm::StringRef getSourceFile() const { return sourceFile; }

  /// Check the configuration for values that cannot work.
  llvm::Error validate() const;

private:
  CommandConfig commands;
  TimeoutConfig timeouts;
  ScanConfig scan;
  CopyConfig copy;
  EnvironmentConfig environment;
  unsigned jobs = 0;
  std::string outputDirectory;
  bool testSourceTree = false;
  bool leaveCopies = false;
  std::string sourceFile;
};

//===----------------------------------------------------------------------===//
// Utility Functions
//===----------------------------------------------------------------------===//

/// Get the list of recognized configuration file names, in lookup order.
llvm::ArrayRef<llvm::StringRef> getConfigFileNames();

/// Split a command line into words using GNU shell-like quoting rules.
std::vector<std::string> splitCommandLine(llvm::StringRef commandLine);

/// Join an argv vector for display, quoting words that contain spaces.
std::string joinCommandLine(llvm::ArrayRef<std::string> argv);

/// Split a NAME=VALUE entry. Returns an empty name if there is no '='.
std::pair<std::string, std::string> parseAssignment(llvm::StringRef entry);

} // namespace mutants

#endif // MUTANTS_SUPPORT_MUTANTSCONFIG_H
