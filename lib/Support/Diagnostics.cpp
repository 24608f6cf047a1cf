//===- Diagnostics.cpp - Caret diagnostics for scan problems --------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutants/Support/Diagnostics.h"
#include "mutants/Support/MutantsError.h"
#include "llvm/Support/FormatVariadic.h"

#include <algorithm>

using namespace mutants;
using llvm::StringRef;

//===----------------------------------------------------------------------===//
// RichDiagnostic
//===----------------------------------------------------------------------===//

RichDiagnostic RichDiagnostic::fromError(const MutantsError &error,
                                         DiagSeverity severity) {
  RichDiagnostic diag(severity, error.getMessage());
  if (error.hasLocation())
    diag.addSpan(SourceSpan(error.getFile(), error.getLine(),
                            std::max(1u, error.getColumn())));
  if (error.getKind() == ErrorKind::Scan)
    diag.addNote("no mutants will be generated from this file")
        .addHelp("list the file under scan.exclude_files to skip it");
  return diag;
}

//===----------------------------------------------------------------------===//
// DiagnosticPrinter
//===----------------------------------------------------------------------===//

DiagnosticPrinter::DiagnosticPrinter(llvm::raw_ostream &os,
                                     DiagnosticOutputFormat format)
    : os(os), format(format),
      useColors(format == DiagnosticOutputFormat::Terminal &&
                os.has_colors()) {}

DiagnosticPrinter::~DiagnosticPrinter() { flush(); }

void DiagnosticPrinter::addSourceText(StringRef filename, StringRef text) {
  sources[filename] = text.str();
}

void DiagnosticPrinter::print(const RichDiagnostic &diag) {
  if (format == DiagnosticOutputFormat::JSON)
    printJSON(diag);
  else
    printText(diag);
}

void DiagnosticPrinter::flush() {
  if (format != DiagnosticOutputFormat::JSON || jsonBuffer.empty())
    return;
  os << llvm::formatv("{0:2}", llvm::json::Value(std::move(jsonBuffer)))
     << "\n";
  jsonBuffer = llvm::json::Array();
  os.flush();
}

void DiagnosticPrinter::printColored(StringRef text,
                                     llvm::raw_ostream::Colors color,
                                     bool bold) {
  if (useColors)
    os.changeColor(color, bold);
  os << text;
  if (useColors)
    os.resetColor();
}

void DiagnosticPrinter::printGutter(unsigned width) {
  printColored(std::string(width, ' ') + " |", llvm::raw_ostream::BLUE,
               /*bold=*/true);
}

StringRef DiagnosticPrinter::getSourceLine(StringRef filename,
                                           unsigned line) const {
  auto it = sources.find(filename);
  if (it == sources.end() || line == 0)
    return "";
  StringRef rest = it->getValue();
  for (unsigned i = 1; i < line; ++i) {
    size_t nl = rest.find('\n');
    if (nl == StringRef::npos)
      return "";
    rest = rest.drop_front(nl + 1);
  }
  return rest.take_until([](char c) { return c == '\n'; }).rtrim('\r');
}

void DiagnosticPrinter::printSpan(const SourceSpan &span) {
  unsigned gutter = std::max<unsigned>(3, std::to_string(span.line).size());

  os << std::string(gutter, ' ');
  printColored("--> ", llvm::raw_ostream::BLUE, /*bold=*/true);
  os << span.filename << ":" << span.line << ":" << span.startColumn << "\n";

  StringRef text = getSourceLine(span.filename, span.line);
  if (text.empty())
    return;

  printGutter(gutter);
  os << "\n";
  std::string number = std::to_string(span.line);
  printColored(std::string(gutter - number.size(), ' ') + number + " |",
               llvm::raw_ostream::BLUE, /*bold=*/true);
  os << " " << text << "\n";

  printGutter(gutter);
  unsigned first = span.startColumn;
  unsigned last = std::max(span.endColumn, first);
  os << " " << std::string(first - 1, ' ');
  printColored(std::string(last - first + 1, '^'), llvm::raw_ostream::RED,
               /*bold=*/true);
  os << "\n";
  printGutter(gutter);
  os << "\n";
}

void DiagnosticPrinter::printText(const RichDiagnostic &diag) {
  llvm::raw_ostream::Colors color = llvm::raw_ostream::BLUE;
  if (diag.getSeverity() == DiagSeverity::Error)
    color = llvm::raw_ostream::RED;
  else if (diag.getSeverity() == DiagSeverity::Warning)
    color = llvm::raw_ostream::YELLOW;
  printColored(getSeverityString(diag.getSeverity()), color, /*bold=*/true);
  os << ": ";
  printColored(diag.getMessage(), llvm::raw_ostream::SAVEDCOLOR,
               /*bold=*/true);
  os << "\n";

  for (const SourceSpan &span : diag.getSpans())
    if (span.isValid())
      printSpan(span);

  for (const std::string &note : diag.getNotes()) {
    printColored("    = ", llvm::raw_ostream::BLUE, /*bold=*/true);
    os << "note: " << note << "\n";
  }
  for (const std::string &help : diag.getHelps()) {
    printColored("    = ", llvm::raw_ostream::CYAN, /*bold=*/true);
    os << "help: " << help << "\n";
  }
}

void DiagnosticPrinter::printJSON(const RichDiagnostic &diag) {
  llvm::json::Object obj;
  obj["severity"] = getSeverityString(diag.getSeverity());
  obj["message"] = diag.getMessage();

  if (!diag.getSpans().empty()) {
    llvm::json::Array locations;
    for (const SourceSpan &span : diag.getSpans()) {
      llvm::json::Object loc;
      loc["file"] = span.filename;
      loc["line"] = span.line;
      loc["column"] = span.startColumn;
      if (span.endColumn)
        loc["endColumn"] = span.endColumn;
      StringRef text = getSourceLine(span.filename, span.line);
      if (!text.empty())
        loc["source"] = text;
      locations.push_back(std::move(loc));
    }
    obj["locations"] = std::move(locations);
  }

  if (!diag.getNotes().empty()) {
    llvm::json::Array notes;
    for (const std::string &note : diag.getNotes())
      notes.push_back(note);
    obj["notes"] = std::move(notes);
  }
  if (!diag.getHelps().empty()) {
    llvm::json::Array helps;
    for (const std::string &help : diag.getHelps())
      helps.push_back(help);
    obj["helps"] = std::move(helps);
  }

  jsonBuffer.push_back(std::move(obj));
}

//===----------------------------------------------------------------------===//
// Utility Functions
//===----------------------------------------------------------------------===//

StringRef mutants::getSeverityString(DiagSeverity severity) {
  switch (severity) {
  case DiagSeverity::Error:
    return "error";
  case DiagSeverity::Warning:
    return "warning";
  case DiagSeverity::Note:
    return "note";
  }
  llvm_unreachable("unknown severity");
}

std::optional<DiagnosticOutputFormat>
mutants::parseDiagnosticOutputFormat(StringRef str) {
  if (str == "terminal" || str == "term")
    return DiagnosticOutputFormat::Terminal;
  if (str == "plain" || str == "text")
    return DiagnosticOutputFormat::Plain;
  if (str == "json")
    return DiagnosticOutputFormat::JSON;
  return std::nullopt;
}

StringRef
mutants::getDiagnosticOutputFormatString(DiagnosticOutputFormat format) {
  switch (format) {
  case DiagnosticOutputFormat::Terminal:
    return "terminal";
  case DiagnosticOutputFormat::Plain:
    return "plain";
  case DiagnosticOutputFormat::JSON:
    return "json";
  }
  llvm_unreachable("unknown diagnostic format");
}
