//===- Generator.cpp - Enumerate the mutations of a tree ------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutants/Mutation/Generator.h"
#include "mutants/Support/MutantsError.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/ADT/StringSwitch.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/Regex.h"
#include "llvm/Support/raw_ostream.h"

#define DEBUG_TYPE "mutants-scanner"

using namespace mutants;
using llvm::StringRef;

//===----------------------------------------------------------------------===//
// Replacement catalogue
//===----------------------------------------------------------------------===//

namespace {
enum class PrimitiveKind { None, Unsigned, Signed, Float };
} // namespace

static PrimitiveKind classifyPrimitive(StringRef type) {
  return llvm::StringSwitch<PrimitiveKind>(type)
      .Cases("u8", "u16", "u32", "u64", "u128", "usize",
             PrimitiveKind::Unsigned)
      .Cases("i8", "i16", "i32", "i64", "i128", "isize", PrimitiveKind::Signed)
      .Cases("f32", "f64", PrimitiveKind::Float)
      .Default(PrimitiveKind::None);
}

/// Match `&str` and `&'a str`.
static bool isStrReference(StringRef type) {
  if (!type.consume_front("&"))
    return false;
  if (type.startswith("'"))
    type = type.drop_until([](char c) { return c == ' '; });
  return type.trim() == "str";
}

/// Split "std::io::Result<Vec<u8>>" into base name "Result" and generic
/// arguments "Vec<u8>".
static void splitGenericType(StringRef type, StringRef &base,
                             StringRef &arguments) {
  StringRef path = type;
  arguments = StringRef();
  size_t open = type.find('<');
  if (open != StringRef::npos && type.endswith(">")) {
    path = type.take_front(open);
    arguments = type.slice(open + 1, type.size() - 1);
  }
  size_t separator = path.rfind("::");
  base = separator == StringRef::npos ? path : path.drop_front(separator + 2);
}

std::vector<std::string>
mutants::getReplacementsForReturnType(StringRef returnType) {
  StringRef type = returnType.trim();
  if (type.empty() || type == "()")
    return {"()"};
  if (type == "bool")
    return {"true", "false"};
  if (type == "String")
    return {"String::new()", "\"xyzzy\".into()"};
  if (isStrReference(type))
    return {"\"\"", "\"xyzzy\""};

  switch (classifyPrimitive(type)) {
  case PrimitiveKind::Unsigned:
    return {"0", "1"};
  case PrimitiveKind::Signed:
    return {"0", "1", "-1"};
  case PrimitiveKind::Float:
    return {"0.0", "1.0", "-1.0"};
  case PrimitiveKind::None:
    break;
  }

  StringRef base, arguments;
  splitGenericType(type, base, arguments);
  if (base == "Result") {
    if (arguments == "()" || arguments.startswith("(),"))
      return {"Ok(())"};
    return {"Ok(Default::default())"};
  }
  if (base == "Option" && !arguments.empty())
    return {"None", "Some(Default::default())"};
  if (base == "Vec")
    return {"vec![]", "vec![Default::default()]"};
  if (base == "Box" && !arguments.empty())
    return {"Box::new(Default::default())"};
  return {"Default::default()"};
}

std::vector<Mutation> mutants::generateMutations(const FileScan &scan) {
  std::vector<Mutation> mutations;
  for (const FunctionSite &site : scan.sites)
    for (const std::string &value :
         getReplacementsForReturnType(site.returnType))
      mutations.emplace_back(site, value);
  return mutations;
}

//===----------------------------------------------------------------------===//
// Discovery
//===----------------------------------------------------------------------===//

/// Record a per-file scan failure. Errors that are not MutantsErrors are
/// returned to the caller.
static llvm::Error recordScanProblem(Discovery &discovery, StringRef file,
                                     StringRef text, llvm::Error err) {
  return llvm::handleErrors(std::move(err), [&](const MutantsError &error) {
    std::string rendered;
    llvm::raw_string_ostream os(rendered);
    error.log(os);
    os.flush();
    LLVM_DEBUG(llvm::dbgs() << "scan problem: " << rendered << "\n");
    discovery.warnings.push_back(std::move(rendered));
    discovery.problems.push_back(ScanProblem{
        file.str(), text.str(),
        RichDiagnostic::fromError(error, DiagSeverity::Warning)});
  });
}

static llvm::Error compileRegexes(llvm::ArrayRef<std::string> patterns,
                                  std::vector<llvm::Regex> &regexes) {
  for (const std::string &pattern : patterns) {
    llvm::Regex regex(pattern);
    std::string error;
    if (!regex.isValid(error))
      return makeError(ErrorKind::Config,
                       "invalid function regex '" + pattern + "': " + error);
    regexes.push_back(std::move(regex));
  }
  return llvm::Error::success();
}

llvm::Expected<Discovery>
mutants::discoverMutations(StringRef root, const MutantsConfig &config) {
  const ScanConfig &scanConfig = config.getScan();
  Scanner scanner(scanConfig);

  std::vector<llvm::Regex> includeRegexes, excludeRegexes;
  if (auto err = compileRegexes(scanConfig.includeFunctions, includeRegexes))
    return std::move(err);
  if (auto err = compileRegexes(scanConfig.excludeFunctions, excludeRegexes))
    return std::move(err);

  auto files = scanner.discoverFiles(root);
  if (!files)
    return files.takeError();

  Discovery discovery;
  discovery.files = std::move(*files);

  std::vector<std::pair<std::string, FileScan>> scanned;
  for (const std::string &file : discovery.files) {
    llvm::SmallString<256> path(root);
    llvm::sys::path::append(path, llvm::sys::path::Style::posix, file);
    llvm::sys::path::native(path);

    auto buffer = llvm::MemoryBuffer::getFile(
        path, /*IsText=*/false, /*RequiresNullTerminator=*/false);
    if (!buffer) {
      if (auto err = recordScanProblem(
              discovery, file, "",
              makeError(ErrorKind::Scan, "cannot read " + file + ": " +
                                             buffer.getError().message())))
        return std::move(err);
      continue;
    }

    StringRef text = (*buffer)->getBuffer();
    if (scanner.isGenerated(text)) {
      LLVM_DEBUG(llvm::dbgs() << file << ": generated code, not scanned\n");
      continue;
    }

    auto scan = scanner.scanFile(file, text);
    if (!scan) {
      if (auto err =
              recordScanProblem(discovery, file, text, scan.takeError()))
        return std::move(err);
      continue;
    }
    scanned.emplace_back(file, std::move(*scan));
  }

  // A skipped `mod name;` skips the file it names and, transitively, every
  // module that file declares.
  llvm::StringSet<> skipped;
  for (const auto &entry : scanned) {
    if (entry.second.fileSkipped)
      skipped.insert(entry.first);
    for (const std::string &child : entry.second.skippedFiles)
      skipped.insert(child);
  }
  for (bool changed = true; changed;) {
    changed = false;
    for (const auto &entry : scanned)
      if (skipped.count(entry.first))
        for (const std::string &child : entry.second.childFiles)
          changed |= skipped.insert(child).second;
  }

  auto isSelected = [&](const Mutation &mutation) {
    std::string name = mutation.getName();
    if (!includeRegexes.empty() &&
        llvm::none_of(includeRegexes, [&](const llvm::Regex &regex) {
          return regex.match(name);
        }))
      return false;
    return llvm::none_of(excludeRegexes, [&](const llvm::Regex &regex) {
      return regex.match(name);
    });
  };

  for (const auto &entry : scanned) {
    if (skipped.count(entry.first)) {
      LLVM_DEBUG(llvm::dbgs() << entry.first << ": skipped module\n");
      continue;
    }
    for (Mutation &mutation : generateMutations(entry.second))
      if (isSelected(mutation))
        discovery.mutations.push_back(std::move(mutation));
  }

  LLVM_DEBUG(llvm::dbgs() << "discovered " << discovery.mutations.size()
                          << " mutations in " << discovery.files.size()
                          << " files\n");
  return std::move(discovery);
}
