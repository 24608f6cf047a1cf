//===- Diagnostics.h - Caret diagnostics for scan problems ------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Formatting for problems found in subject source files, mostly files the
// scanner could not parse. Output looks like:
//
//   warning: unterminated block comment
//      --> src/lib.rs:12:5
//       |
//    12 |     /* never closed
//       |     ^
//       |
//       = note: no mutants will be generated from this file
//
// The JSON format buffers diagnostics and emits a single array on flush().
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_SUPPORT_DIAGNOSTICS_H
#define MUTANTS_SUPPORT_DIAGNOSTICS_H

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"

#include <optional>
#include <string>

namespace mutants {

class MutantsError;

//===----------------------------------------------------------------------===//
// Diagnostic
//===----------------------------------------------------------------------===//

enum class DiagSeverity { Error, Warning, Note };

/// A 1-based location in a subject file, optionally spanning several columns
/// on one line.
struct SourceSpan {
  std::string filename;
  unsigned line = 0;
  unsigned startColumn = 0;
  /// Inclusive. Zero means a single column.
  unsigned endColumn = 0;

  SourceSpan() = default;
  SourceSpan(llvm::StringRef filename, unsigned line, unsigned startColumn,
             unsigned endColumn = 0)
      : filename(filename.str()), line(line), startColumn(startColumn),
        endColumn(endColumn) {}

  bool isValid() const { return line > 0 && startColumn > 0; }
};

class RichDiagnostic {
public:
  RichDiagnostic(DiagSeverity severity, llvm::StringRef message)
      : severity(severity), message(message.str()) {}

  /// Build a diagnostic from a MutantsError, using its location if it has one.
  static RichDiagnostic fromError(const MutantsError &error,
                                  DiagSeverity severity);

  DiagSeverity getSeverity() const { return severity; }
  llvm::StringRef getMessage() const { return message; }

  RichDiagnostic &addSpan(SourceSpan span) {
    spans.push_back(std::move(span));
    return *this;
  }
  RichDiagnostic &addNote(llvm::StringRef note) {
    notes.push_back(note.str());
    return *this;
  }
  RichDiagnostic &addHelp(llvm::StringRef help) {
    helps.push_back(help.str());
    return *this;
  }

  llvm::ArrayRef<SourceSpan> getSpans() const { return spans; }
  llvm::ArrayRef<std::string> getNotes() const { return notes; }
  llvm::ArrayRef<std::string> getHelps() const { return helps; }

private:
  DiagSeverity severity;
  std::string message;
  llvm::SmallVector<SourceSpan, 1> spans;
  llvm::SmallVector<std::string, 2> notes;
  llvm::SmallVector<std::string, 1> helps;
};

//===----------------------------------------------------------------------===//
// DiagnosticPrinter
//===----------------------------------------------------------------------===//

enum class DiagnosticOutputFormat {
  /// Caret output with ANSI colors when the stream supports them.
  Terminal,
  /// Caret output without colors.
  Plain,
  /// A JSON array, written on flush().
  JSON,
};

class DiagnosticPrinter {
public:
  explicit DiagnosticPrinter(
      llvm::raw_ostream &os,
      DiagnosticOutputFormat format = DiagnosticOutputFormat::Terminal);
  ~DiagnosticPrinter();

  DiagnosticPrinter(const DiagnosticPrinter &) = delete;
  DiagnosticPrinter &operator=(const DiagnosticPrinter &) = delete;

  DiagnosticOutputFormat getFormat() const { return format; }
  void setUseColors(bool enable) { useColors = enable; }

  /// Register the text of a file so that spans in it can show the source
  /// line. The text is copied.
  void addSourceText(llvm::StringRef filename, llvm::StringRef text);

  void print(const RichDiagnostic &diag);

  /// Emit any buffered JSON output.
  void flush();

private:
  void printText(const RichDiagnostic &diag);
  void printJSON(const RichDiagnostic &diag);
  void printSpan(const SourceSpan &span);
  void printGutter(unsigned width);
  void printColored(llvm::StringRef text, llvm::raw_ostream::Colors color,
                    bool bold);

  /// Return the text of \p line (1-based) in \p filename, or an empty
  /// string if the file was never registered or is too short.
  llvm::StringRef getSourceLine(llvm::StringRef filename, unsigned line) const;

  llvm::raw_ostream &os;
  DiagnosticOutputFormat format;
  bool useColors;
  llvm::StringMap<std::string> sources;
  llvm::json::Array jsonBuffer;
};

llvm::StringRef getSeverityString(DiagSeverity severity);

/// Parse "terminal", "plain" or "json" (plus "term" and "text" aliases).
std::optional<DiagnosticOutputFormat>
parseDiagnosticOutputFormat(llvm::StringRef str);

llvm::StringRef getDiagnosticOutputFormatString(DiagnosticOutputFormat format);

} // namespace mutants

#endif // MUTANTS_SUPPORT_DIAGNOSTICS_H
