//===- MutantsError.cpp - Error taxonomy for mutation runs ----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutants/Support/MutantsError.h"
#include "llvm/Support/raw_ostream.h"

#include <optional>

using namespace mutants;

char MutantsError::ID = 0;

llvm::StringRef mutants::getErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Scan:
    return "scan";
  case ErrorKind::Isolation:
    return "isolation";
  case ErrorKind::Toolchain:
    return "toolchain";
  case ErrorKind::BaselineBroken:
    return "baseline";
  case ErrorKind::Config:
    return "config";
  }
  llvm_unreachable("unknown error kind");
}

MutantsError::MutantsError(ErrorKind kind, const llvm::Twine &message)
    : kind(kind), message(message.str()) {}

MutantsError::MutantsError(ErrorKind kind, const llvm::Twine &message,
                           llvm::StringRef file, unsigned line,
                           unsigned column)
    : kind(kind), message(message.str()), file(file.str()), line(line),
      column(column) {}

void MutantsError::log(llvm::raw_ostream &os) const {
  if (hasLocation()) {
    os << file << ":" << line;
    if (column)
      os << ":" << column;
    os << ": ";
  }
  os << message;
}

std::error_code MutantsError::convertToErrorCode() const {
  switch (kind) {
  case ErrorKind::Scan:
  case ErrorKind::Config:
    return std::make_error_code(std::errc::invalid_argument);
  case ErrorKind::Isolation:
    return std::make_error_code(std::errc::io_error);
  case ErrorKind::Toolchain:
    return std::make_error_code(std::errc::no_such_file_or_directory);
  case ErrorKind::BaselineBroken:
    return std::make_error_code(std::errc::state_not_recoverable);
  }
  llvm_unreachable("unknown error kind");
}

llvm::Error mutants::makeError(ErrorKind kind, const llvm::Twine &message) {
  return llvm::make_error<MutantsError>(kind, message);
}

llvm::Error mutants::makeScanError(const llvm::Twine &message,
                                   llvm::StringRef file, unsigned line,
                                   unsigned column) {
  return llvm::make_error<MutantsError>(ErrorKind::Scan, message, file, line,
                                        column);
}

ErrorKind mutants::takeErrorKind(llvm::Error err, std::string &message,
                                 ErrorKind fallback) {
  std::optional<ErrorKind> kind;
  message.clear();
  // In a joined error a kind that stops the run outranks per-item kinds.
  auto record = [&](ErrorKind current, llvm::StringRef text) {
    if (!kind || (isRecoverable(*kind) && !isRecoverable(current)))
      kind = current;
    if (!message.empty())
      message += "; ";
    message += text.str();
  };
  llvm::handleAllErrors(
      std::move(err),
      [&](const MutantsError &e) {
        std::string text;
        llvm::raw_string_ostream os(text);
        e.log(os);
        record(e.getKind(), os.str());
      },
      [&](const llvm::ErrorInfoBase &e) { record(fallback, e.message()); });
  return kind.value_or(fallback);
}
