//===- Mutation.cpp - A single source replacement -------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutants/Mutation/Mutation.h"
#include "mutants/Support/MutantsError.h"

#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <algorithm>

using namespace mutants;
using llvm::StringRef;

std::string Mutation::getLocation() const {
  return (site.file + ":" + llvm::Twine(site.line) + ":" +
          llvm::Twine(site.column))
      .str();
}

std::string Mutation::describeChange() const {
  std::string out = "replace " + site.functionName;
  if (!site.returnType.empty())
    out += " -> " + site.returnType;
  out += " with " + replacement;
  return out;
}

std::string Mutation::getName() const {
  return getLocation() + ": " + describeChange();
}

std::string Mutation::getReplacementText() const {
  return (llvm::Twine("{ ") + replacement + " " + kMutationMarker + " }")
      .str();
}

llvm::Expected<std::string> Mutation::applyTo(StringRef original) const {
  if (site.bodyEnd > original.size() || site.bodyStart + 2 > site.bodyEnd ||
      original[site.bodyStart] != '{' || original[site.bodyEnd - 1] != '}')
    return makeError(ErrorKind::Isolation,
                     "source of " + site.file +
                         " no longer matches the scanned body of " +
                         site.functionName);

  std::string mutated;
  mutated.reserve(original.size() + replacement.size() + 40);
  mutated += original.take_front(site.bodyStart).str();
  mutated += getReplacementText();
  mutated += original.drop_front(site.bodyEnd).str();
  return std::move(mutated);
}

llvm::Error Mutation::applyInTree(StringRef treeRoot) const {
  llvm::SmallString<256> path(treeRoot);
  llvm::sys::path::append(path, llvm::sys::path::Style::posix, site.file);
  llvm::sys::path::native(path);

  auto buffer = llvm::MemoryBuffer::getFile(path, /*IsText=*/false,
                                            /*RequiresNullTerminator=*/false);
  if (!buffer)
    return makeError(ErrorKind::Isolation, "cannot read " + path.str() + ": " +
                                               buffer.getError().message());

  auto mutated = applyTo((*buffer)->getBuffer());
  if (!mutated)
    return mutated.takeError();

  std::error_code ec;
  llvm::raw_fd_ostream os(path, ec);
  if (ec)
    return makeError(ErrorKind::Isolation,
                     "cannot write " + path.str() + ": " + ec.message());
  os << *mutated;
  os.close();
  if (os.has_error()) {
    std::error_code writeError = os.error();
    os.clear_error();
    return makeError(ErrorKind::Isolation, "cannot write " + path.str() +
                                               ": " + writeError.message());
  }
  return llvm::Error::success();
}

/// Split \p text into lines without their terminators. A trailing newline
/// does not start another line.
static llvm::SmallVector<StringRef, 0> splitLines(StringRef text) {
  llvm::SmallVector<StringRef, 0> lines;
  text.split(lines, '\n');
  if (!lines.empty() && lines.back().empty())
    lines.pop_back();
  return lines;
}

/// Return the 0-based index of the line containing byte \p offset.
static size_t getLineIndex(StringRef text, size_t offset) {
  return std::count(text.begin(), text.begin() + offset, '\n');
}

std::string Mutation::getUnifiedDiff(StringRef original) const {
  if (site.bodyEnd > original.size() || site.bodyStart >= site.bodyEnd)
    return "";

  auto lines = splitLines(original);
  size_t first = getLineIndex(original, site.bodyStart);
  size_t last = getLineIndex(original, site.bodyEnd - 1);
  if (last >= lines.size())
    return "";

  // Text on the first and last changed lines outside the body survives.
  size_t firstLineStart = original.rfind('\n', site.bodyStart);
  firstLineStart = firstLineStart == StringRef::npos ? 0 : firstLineStart + 1;
  size_t lastLineEnd = original.find('\n', site.bodyEnd);
  if (lastLineEnd == StringRef::npos)
    lastLineEnd = original.size();
  std::string newLine =
      (original.slice(firstLineStart, site.bodyStart) + getReplacementText() +
       original.slice(site.bodyEnd, lastLineEnd))
          .str();

  const size_t context = 3;
  size_t begin = first > context ? first - context : 0;
  size_t end = std::min(lines.size(), last + 1 + context);
  size_t oldCount = end - begin;
  size_t newCount = oldCount - (last - first);

  std::string out;
  llvm::raw_string_ostream os(out);
  os << "--- " << site.file << "\n";
  os << "+++ " << describeChange() << "\n";
  os << "@@ -" << begin + 1 << "," << oldCount << " +" << begin + 1 << ","
     << newCount << " @@\n";
  for (size_t i = begin; i < first; ++i)
    os << " " << lines[i] << "\n";
  for (size_t i = first; i <= last; ++i)
    os << "-" << lines[i] << "\n";
  os << "+" << newLine << "\n";
  for (size_t i = last + 1; i < end; ++i)
    os << " " << lines[i] << "\n";
  os.flush();
  return out;
}

llvm::json::Object Mutation::toJSON() const {
  return llvm::json::Object{
      {"name", getName()},
      {"file", site.file},
      {"function", site.functionName},
      {"return_type", site.returnType},
      {"replacement", replacement},
      {"line", static_cast<int64_t>(site.line)},
      {"column", static_cast<int64_t>(site.column)},
      {"span",
       llvm::json::Object{{"start", static_cast<int64_t>(site.bodyStart)},
                          {"end", static_cast<int64_t>(site.bodyEnd)}}},
  };
}
