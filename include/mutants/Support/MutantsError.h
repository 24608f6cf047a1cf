//===- MutantsError.h - Error taxonomy for mutation runs --------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Errors raised while discovering and evaluating mutants. Every error carries
// an ErrorKind so callers can tell per-item problems (a file that does not
// parse, a scratch copy that could not be written) from structural ones (the
// toolchain cannot be launched, the unmutated tree is broken).
//
// Phase failures and timeouts are not errors; they are recorded as outcomes.
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_SUPPORT_MUTANTSERROR_H
#define MUTANTS_SUPPORT_MUTANTSERROR_H

#include "llvm/ADT/StringRef.h"
#include "llvm/ADT/Twine.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <string>

namespace mutants {

enum class ErrorKind {
  /// A source file could not be tokenized or parsed.
  Scan,
  /// A scratch copy could not be created, mutated or restored.
  Isolation,
  /// An external command could not be started.
  Toolchain,
  /// The unmutated tree does not pass its own pipeline.
  BaselineBroken,
  /// The configuration file or command line is invalid.
  Config,
};

/// Return a short lowercase name for the kind ("scan", "isolation", ...).
llvm::StringRef getErrorKindName(ErrorKind kind);

/// Return true if errors of this kind only affect one file or one scenario.
inline bool isRecoverable(ErrorKind kind) {
  return kind == ErrorKind::Scan || kind == ErrorKind::Isolation;
}

class MutantsError : public llvm::ErrorInfo<MutantsError> {
public:
  static char ID;

  MutantsError(ErrorKind kind, const llvm::Twine &message);

  /// Create an error pointing at a source location (1-based line/column).
  MutantsError(ErrorKind kind, const llvm::Twine &message,
               llvm::StringRef file, unsigned line, unsigned column);

  ErrorKind getKind() const { return kind; }
  llvm::StringRef getMessage() const { return message; }
  llvm::StringRef getFile() const { return file; }
  unsigned getLine() const { return line; }
  unsigned getColumn() const { return column; }
  bool hasLocation() const { return !file.empty() && line != 0; }

  void log(llvm::raw_ostream &os) const override;
  std::error_code convertToErrorCode() const override;

private:
  ErrorKind kind;
  std::string message;
  std::string file;
  unsigned line = 0;
  unsigned column = 0;
};

/// Convenience constructors.
llvm::Error makeError(ErrorKind kind, const llvm::Twine &message);
llvm::Error makeScanError(const llvm::Twine &message, llvm::StringRef file,
                          unsigned line, unsigned column);

/// Consume \p err and return its kind. Errors that are not MutantsErrors are
/// reported as \p fallback. For a joined error the first non-recoverable kind
/// wins, and \p message receives every message separated by "; ".
ErrorKind takeErrorKind(llvm::Error err, std::string &message,
                        ErrorKind fallback = ErrorKind::Toolchain);

} // namespace mutants

#endif // MUTANTS_SUPPORT_MUTANTSERROR_H
