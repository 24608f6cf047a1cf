//===- BuildDir.cpp - Private scratch copies of the subject tree ----------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutants/Lab/BuildDir.h"
#include "mutants/Support/MutantsError.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/Errno.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/raw_ostream.h"

#include <unistd.h>

#define DEBUG_TYPE "mutants-isolation"

using namespace mutants;
using llvm::StringRef;
namespace fs = llvm::sys::fs;

static llvm::Error isolationError(const llvm::Twine &what, StringRef file,
                                  std::error_code ec) {
  return makeError(ErrorKind::Isolation,
                   what + " " + file + ": " + ec.message());
}

/// Recreate the symbolic link \p source at \p target with the same contents.
static llvm::Error copySymlink(StringRef source, StringRef target) {
  llvm::SmallString<256> nulTerminated(source);
  char buffer[4096];
  ssize_t length =
      ::readlink(nulTerminated.c_str(), buffer, sizeof(buffer) - 1);
  if (length < 0)
    return isolationError("cannot read link", source,
                          std::error_code(errno, std::generic_category()));
  StringRef destination(buffer, length);
  if (std::error_code ec = fs::create_link(destination, target))
    return isolationError("cannot create link", target, ec);
  return llvm::Error::success();
}

static llvm::Error copyTree(StringRef from, StringRef to,
                            const CopyConfig &config, uint64_t &bytes) {
  std::error_code ec;
  for (fs::recursive_directory_iterator it(from, ec, /*follow_symlinks=*/false),
       end;
       it != end && !ec; it.increment(ec)) {
    StringRef source = it->path();
    StringRef name = llvm::sys::path::filename(source);
    llvm::SmallString<256> target(to);
    llvm::sys::path::append(target, source.drop_front(from.size()));

    if (it->type() == fs::file_type::directory_file) {
      if (llvm::is_contained(config.exclude, name)) {
        LLVM_DEBUG(llvm::dbgs() << "not copying " << source << "\n");
        it.no_push();
        continue;
      }
      if (std::error_code dirError = fs::create_directories(target))
        return isolationError("cannot create", target, dirError);
      continue;
    }

    if (it->type() == fs::file_type::symlink_file) {
      if (auto err = copySymlink(source, target))
        return err;
      continue;
    }

    fs::file_status status;
    if (std::error_code statusError = fs::status(source, status))
      return isolationError("cannot stat", source, statusError);
    if (status.type() != fs::file_type::regular_file) {
      LLVM_DEBUG(llvm::dbgs() << "skipping special file " << source << "\n");
      continue;
    }
    if (std::error_code copyError = fs::copy_file(source, target))
      return isolationError("cannot copy", source, copyError);
    if (std::error_code permError =
            fs::setPermissions(target, status.permissions()))
      return isolationError("cannot set permissions of", target, permError);
    bytes += status.getSize();
  }
  if (ec)
    return isolationError("cannot list", from, ec);
  return llvm::Error::success();
}

llvm::Expected<std::unique_ptr<BuildDir>>
BuildDir::prepare(StringRef sourceRoot, const CopyConfig &copy,
                  bool leaveCopy) {
  llvm::SmallString<256> root(sourceRoot);
  if (std::error_code ec = fs::make_absolute(root))
    return isolationError("cannot resolve", sourceRoot, ec);
  llvm::sys::path::remove_dots(root, /*remove_dot_dot=*/true);

  llvm::SmallString<256> scratch;
  std::string prefix = ("mutants-" + llvm::sys::path::filename(root)).str();
  if (std::error_code ec = fs::createUniqueDirectory(prefix, scratch))
    return isolationError("cannot create scratch directory for", root, ec);

  std::unique_ptr<BuildDir> dir(new BuildDir(scratch.str().str(), leaveCopy));
  LLVM_DEBUG(llvm::dbgs() << "copying " << root << " to " << scratch << "\n");
  if (auto err = copyTree(root, scratch, copy, dir->bytesCopied))
    return std::move(err);
  return std::move(dir);
}

BuildDir::~BuildDir() {
  if (leaveCopy) {
    LLVM_DEBUG(llvm::dbgs() << "leaving " << path << "\n");
    return;
  }
  if (std::error_code ec = fs::remove_directories(path))
    LLVM_DEBUG(llvm::dbgs() << "cannot remove " << path << ": "
                            << ec.message() << "\n");
}

llvm::Error BuildDir::apply(const Mutation &mutation) {
  if (applied)
    return makeError(ErrorKind::Isolation,
                     "a mutation is already applied in " + path);

  llvm::SmallString<256> file(path);
  llvm::sys::path::append(file, llvm::sys::path::Style::posix,
                          mutation.getFile());
  llvm::sys::path::native(file);
  auto buffer = llvm::MemoryBuffer::getFile(file, /*IsText=*/false,
                                            /*RequiresNullTerminator=*/false);
  if (!buffer)
    return isolationError("cannot read", file, buffer.getError());

  applied = AppliedMutation{file.str().str(), (*buffer)->getBuffer().str()};
  if (auto err = mutation.applyInTree(path)) {
    applied.reset();
    return err;
  }
  return llvm::Error::success();
}

llvm::Error BuildDir::reset() {
  if (!applied)
    return llvm::Error::success();

  std::error_code ec;
  llvm::raw_fd_ostream os(applied->file, ec);
  if (ec)
    return isolationError("cannot restore", applied->file, ec);
  os << applied->originalText;
  os.close();
  if (os.has_error()) {
    std::error_code writeError = os.error();
    os.clear_error();
    return isolationError("cannot restore", applied->file, writeError);
  }
  applied.reset();
  return llvm::Error::success();
}
