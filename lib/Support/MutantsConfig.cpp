//===- MutantsConfig.cpp - Run configuration ------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements loading and validation of the run configuration.
//
//===----------------------------------------------------------------------===//

#include "mutants/Support/MutantsConfig.h"
#include "mutants/Support/MutantsError.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Allocator.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/GlobPattern.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Regex.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/StringSaver.h"
#include "llvm/Support/YAMLParser.h"

#include <algorithm>
#include <thread>

using namespace mutants;
using llvm::StringRef;

//===----------------------------------------------------------------------===//
// Configuration File Names
//===----------------------------------------------------------------------===//

static const StringRef configFileNames[] = {".mutants.yaml", "mutants.yaml",
                                            ".mutants.yml", "mutants.yml"};

llvm::ArrayRef<StringRef> mutants::getConfigFileNames() {
  return configFileNames;
}

//===----------------------------------------------------------------------===//
// Command Lines
//===----------------------------------------------------------------------===//

std::vector<std::string> mutants::splitCommandLine(StringRef commandLine) {
  llvm::BumpPtrAllocator alloc;
  llvm::StringSaver saver(alloc);
  llvm::SmallVector<const char *, 8> words;
  llvm::cl::TokenizeGNUCommandLine(commandLine, saver, words);
  std::vector<std::string> result;
  for (const char *word : words)
    if (word)
      result.emplace_back(word);
  return result;
}

std::string mutants::joinCommandLine(llvm::ArrayRef<std::string> argv) {
  std::string result;
  for (const std::string &word : argv) {
    if (!result.empty())
      result += ' ';
    if (word.empty() || word.find_first_of(" \t\"'") != std::string::npos) {
      result += '\'';
      for (char c : word) {
        if (c == '\'')
          result += "'\\''";
        else
          result += c;
      }
      result += '\'';
    } else {
      result += word;
    }
  }
  return result;
}

std::pair<std::string, std::string> mutants::parseAssignment(StringRef entry) {
  size_t pos = entry.find('=');
  if (pos == StringRef::npos)
    return {"", entry.str()};
  return {entry.substr(0, pos).str(), entry.substr(pos + 1).str()};
}

//===----------------------------------------------------------------------===//
// YAML Parsing Helpers
//===----------------------------------------------------------------------===//

namespace {

/// Walks the YAML document and records the first shape error it sees.
class ConfigParser {
public:
  explicit ConfigParser(MutantsConfig &config) : config(config) {}

  void parseRoot(llvm::yaml::MappingNode *root);

  /// Return the first error, or success.
  llvm::Error takeError() {
    if (firstError.empty())
      return llvm::Error::success();
    return makeError(ErrorKind::Config, firstError);
  }

private:
  void fail(const llvm::Twine &message) {
    if (firstError.empty())
      firstError = message.str();
  }

  template <typename Callback>
  void forEachEntry(llvm::yaml::Node *node, StringRef section,
                    Callback callback);

  StringRef getScalar(llvm::yaml::Node *node, StringRef key,
                      llvm::SmallVectorImpl<char> &storage);
  bool getBool(llvm::yaml::Node *node, StringRef key, bool &out);
  void getNumber(llvm::yaml::Node *node, StringRef key, double &out);
  void getStrings(llvm::yaml::Node *node, StringRef key,
                  std::vector<std::string> &out);
  void getCommand(llvm::yaml::Node *node, StringRef key,
                  std::vector<std::string> &out);

  void parseCommands(llvm::yaml::Node *node);
  void parseTimeouts(llvm::yaml::Node *node);
  void parseScan(llvm::yaml::Node *node);
  void parseCopy(llvm::yaml::Node *node);
  void parseEnvironment(llvm::yaml::Node *node);

  MutantsConfig &config;
  std::string firstError;
};

} // namespace

template <typename Callback>
void ConfigParser::forEachEntry(llvm::yaml::Node *node, StringRef section,
                                Callback callback) {
  if (llvm::isa<llvm::yaml::NullNode>(node))
    return;
  auto *mapping = llvm::dyn_cast<llvm::yaml::MappingNode>(node);
  if (!mapping) {
    fail("'" + section + "' must be a mapping");
    return;
  }
  for (auto &entry : *mapping) {
    auto *keyNode = llvm::dyn_cast_or_null<llvm::yaml::ScalarNode>(
        entry.getKey());
    if (!keyNode) {
      fail("'" + section + "' has a non-scalar key");
      continue;
    }
    llvm::SmallString<32> keyStorage;
    StringRef key = keyNode->getValue(keyStorage);
    callback(key, entry.getValue());
  }
}

StringRef ConfigParser::getScalar(llvm::yaml::Node *node, StringRef key,
                                  llvm::SmallVectorImpl<char> &storage) {
  if (auto *scalar = llvm::dyn_cast_or_null<llvm::yaml::ScalarNode>(node))
    return scalar->getValue(storage);
  fail("'" + key + "' must be a scalar");
  return "";
}

bool ConfigParser::getBool(llvm::yaml::Node *node, StringRef key, bool &out) {
  llvm::SmallString<16> storage;
  StringRef value = getScalar(node, key, storage);
  if (value == "true" || value == "yes" || value == "on" || value == "1") {
    out = true;
    return true;
  }
  if (value == "false" || value == "no" || value == "off" || value == "0") {
    out = false;
    return true;
  }
  fail("'" + key + "' must be a boolean, got '" + value + "'");
  return false;
}

void ConfigParser::getNumber(llvm::yaml::Node *node, StringRef key,
                             double &out) {
  llvm::SmallString<16> storage;
  StringRef value = getScalar(node, key, storage);
  double parsed;
  if (value.getAsDouble(parsed)) {
    fail("'" + key + "' must be a number, got '" + value + "'");
    return;
  }
  out = parsed;
}

void ConfigParser::getStrings(llvm::yaml::Node *node, StringRef key,
                              std::vector<std::string> &out) {
  if (llvm::isa<llvm::yaml::NullNode>(node)) {
    out.clear();
    return;
  }
  auto *seq = llvm::dyn_cast<llvm::yaml::SequenceNode>(node);
  if (!seq) {
    fail("'" + key + "' must be a list");
    return;
  }
  out.clear();
  for (auto &item : *seq) {
    llvm::SmallString<64> storage;
    StringRef value = getScalar(&item, key, storage);
    if (!value.empty())
      out.push_back(value.str());
  }
}

void ConfigParser::getCommand(llvm::yaml::Node *node, StringRef key,
                              std::vector<std::string> &out) {
  if (llvm::isa<llvm::yaml::SequenceNode>(node)) {
    getStrings(node, key, out);
    return;
  }
  llvm::SmallString<64> storage;
  out = splitCommandLine(getScalar(node, key, storage));
}

void ConfigParser::parseCommands(llvm::yaml::Node *node) {
  CommandConfig &commands = config.getCommands();
  forEachEntry(node, "commands", [&](StringRef key, llvm::yaml::Node *value) {
    if (key == "check")
      getCommand(value, key, commands.check);
    else if (key == "build")
      getCommand(value, key, commands.build);
    else if (key == "test")
      getCommand(value, key, commands.test);
    else if (key == "check_enabled")
      getBool(value, key, commands.checkEnabled);
  });
}

void ConfigParser::parseTimeouts(llvm::yaml::Node *node) {
  TimeoutConfig &timeouts = config.getTimeouts();
  forEachEntry(node, "timeouts", [&](StringRef key, llvm::yaml::Node *value) {
    if (key == "check")
      getNumber(value, key, timeouts.check);
    else if (key == "build")
      getNumber(value, key, timeouts.build);
    else if (key == "test")
      getNumber(value, key, timeouts.test);
    else if (key == "minimum")
      getNumber(value, key, timeouts.minimum);
    else if (key == "multiplier")
      getNumber(value, key, timeouts.multiplier);
    else if (key == "baseline")
      getNumber(value, key, timeouts.baseline);
  });
}

void ConfigParser::parseScan(llvm::yaml::Node *node) {
  ScanConfig &scan = config.getScan();
  forEachEntry(node, "scan", [&](StringRef key, llvm::yaml::Node *value) {
    if (key == "source_dirs")
      getStrings(value, key, scan.sourceDirs);
    else if (key == "include_files")
      getStrings(value, key, scan.includeFiles);
    else if (key == "exclude_files")
      getStrings(value, key, scan.excludeFiles);
    else if (key == "include_functions")
      getStrings(value, key, scan.includeFunctions);
    else if (key == "exclude_functions")
      getStrings(value, key, scan.excludeFunctions);
    else if (key == "skip_attributes")
      getStrings(value, key, scan.skipAttributes);
    else if (key == "generated_markers")
      getStrings(value, key, scan.generatedMarkers);
  });
}

void ConfigParser::parseCopy(llvm::yaml::Node *node) {
  forEachEntry(node, "copy", [&](StringRef key, llvm::yaml::Node *value) {
    if (key == "exclude")
      getStrings(value, key, config.getCopy().exclude);
  });
}

void ConfigParser::parseEnvironment(llvm::yaml::Node *node) {
  EnvironmentConfig &env = config.getEnvironment();
  forEachEntry(node, "environment",
               [&](StringRef key, llvm::yaml::Node *value) {
                 if (key == "remove")
                   getStrings(value, key, env.remove);
                 else if (key == "set")
                   getStrings(value, key, env.set);
               });
}

void ConfigParser::parseRoot(llvm::yaml::MappingNode *root) {
  forEachEntry(root, "root", [&](StringRef key, llvm::yaml::Node *value) {
    if (key == "commands") {
      parseCommands(value);
    } else if (key == "timeouts") {
      parseTimeouts(value);
    } else if (key == "scan") {
      parseScan(value);
    } else if (key == "copy") {
      parseCopy(value);
    } else if (key == "environment") {
      parseEnvironment(value);
    } else if (key == "jobs") {
      llvm::SmallString<16> storage;
      StringRef text = getScalar(value, key, storage);
      unsigned jobs;
      if (text.getAsInteger(10, jobs))
        fail("'jobs' must be a non-negative integer, got '" + text + "'");
      else
        config.setJobs(jobs);
    } else if (key == "output") {
      llvm::SmallString<64> storage;
      config.setOutputDirectory(getScalar(value, key, storage));
    } else if (key == "test_source_tree") {
      bool enable;
      if (getBool(value, key, enable))
        config.setTestSourceTree(enable);
    } else if (key == "leave_copies") {
      bool enable;
      if (getBool(value, key, enable))
        config.setLeaveCopies(enable);
    }
  });
}

static void collectYAMLDiagnostic(const llvm::SMDiagnostic &diag,
                                  void *context) {
  auto *message = static_cast<std::string *>(context);
  if (message->empty())
    *message = (llvm::Twine(diag.getLineNo()) + ":" +
                llvm::Twine(diag.getColumnNo() + 1) + ": " + diag.getMessage())
                   .str();
}

//===----------------------------------------------------------------------===//
// MutantsConfig Implementation
//===----------------------------------------------------------------------===//

MutantsConfig::MutantsConfig() = default;
MutantsConfig::~MutantsConfig() = default;

llvm::Expected<std::unique_ptr<MutantsConfig>>
MutantsConfig::loadFromFile(StringRef filePath) {
  auto fileOrErr = llvm::MemoryBuffer::getFile(filePath);
  if (auto ec = fileOrErr.getError())
    return makeError(ErrorKind::Config, "failed to open config file " +
                                            filePath + ": " + ec.message());

  auto result = loadFromYAML((*fileOrErr)->getBuffer());
  if (!result)
    return makeError(ErrorKind::Config, filePath + ": " +
                                            llvm::toString(result.takeError()));
  (*result)->sourceFile = filePath.str();
  return result;
}

llvm::Expected<std::unique_ptr<MutantsConfig>>
MutantsConfig::loadFromYAML(StringRef yamlContent) {
  auto config = std::make_unique<MutantsConfig>();

  if (yamlContent.trim().empty())
    return std::move(config);

  std::string yamlError;
  llvm::SourceMgr srcMgr;
  srcMgr.setDiagHandler(collectYAMLDiagnostic, &yamlError);
  llvm::yaml::Stream stream(yamlContent, srcMgr);

  auto docIt = stream.begin();
  if (docIt == stream.end())
    return std::move(config);

  llvm::yaml::Node *rootNode = docIt->getRoot();
  if (!rootNode || llvm::isa<llvm::yaml::NullNode>(rootNode)) {
    if (!yamlError.empty())
      return makeError(ErrorKind::Config, "invalid YAML: " + yamlError);
    return std::move(config);
  }

  auto *root = llvm::dyn_cast<llvm::yaml::MappingNode>(rootNode);
  if (!root)
    return makeError(ErrorKind::Config, "config root must be a mapping");

  ConfigParser parser(*config);
  parser.parseRoot(root);
  if (!yamlError.empty()) {
    llvm::consumeError(parser.takeError());
    return makeError(ErrorKind::Config, "invalid YAML: " + yamlError);
  }
  if (auto err = parser.takeError())
    return std::move(err);

  return std::move(config);
}

llvm::Expected<std::unique_ptr<MutantsConfig>>
MutantsConfig::findAndLoad(StringRef directory) {
  llvm::SmallString<256> path;
  for (StringRef name : configFileNames) {
    path = directory;
    llvm::sys::path::append(path, name);
    if (llvm::sys::fs::exists(path))
      return loadFromFile(path);
  }
  return std::make_unique<MutantsConfig>();
}

unsigned MutantsConfig::getEffectiveJobs() const {
  if (jobs)
    return jobs;
  return std::max(1u, std::thread::hardware_concurrency());
}

//===----------------------------------------------------------------------===//
// Validation
//===----------------------------------------------------------------------===//

llvm::Error MutantsConfig::validate() const {
  if (commands.build.empty())
    return makeError(ErrorKind::Config, "build command is empty");
  if (commands.test.empty())
    return makeError(ErrorKind::Config, "test command is empty");
  if (commands.checkEnabled && commands.check.empty())
    return makeError(ErrorKind::Config,
                     "check command is empty but checking is enabled");

  const std::pair<StringRef, double> timeoutValues[] = {
      {"check", timeouts.check},     {"build", timeouts.build},
      {"test", timeouts.test},       {"minimum", timeouts.minimum},
      {"baseline", timeouts.baseline}};
  for (const auto &entry : timeoutValues)
    if (entry.second < 0)
      return makeError(ErrorKind::Config,
                       entry.first + " timeout must not be negative");
  if (timeouts.multiplier <= 0)
    return makeError(ErrorKind::Config, "timeout multiplier must be positive");
  if (timeouts.baseline <= 0)
    return makeError(ErrorKind::Config, "baseline timeout must be positive");

  if (scan.sourceDirs.empty())
    return makeError(ErrorKind::Config, "no source directories configured");

  for (const auto *patterns : {&scan.includeFiles, &scan.excludeFiles}) {
    for (const std::string &pattern : *patterns) {
      auto glob = llvm::GlobPattern::create(pattern);
      if (!glob)
        return makeError(ErrorKind::Config,
                         "invalid file pattern '" + pattern +
                             "': " + llvm::toString(glob.takeError()));
    }
  }

  for (const auto *patterns :
       {&scan.includeFunctions, &scan.excludeFunctions}) {
    for (const std::string &pattern : *patterns) {
      std::string reason;
      if (!llvm::Regex(pattern).isValid(reason))
        return makeError(ErrorKind::Config, "invalid function regex '" +
                                                pattern + "': " + reason);
    }
  }

  for (const std::string &entry : environment.set) {
    if (parseAssignment(entry).first.empty())
      return makeError(ErrorKind::Config,
                       "environment entry '" + entry +
                           "' must have the form NAME=VALUE");
  }

  return llvm::Error::success();
}
