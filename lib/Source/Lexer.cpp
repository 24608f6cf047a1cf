//===- Lexer.cpp - Rust token stream --------------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutants/Source/Lexer.h"
#include "mutants/Support/MutantsError.h"
#include "llvm/ADT/StringExtras.h"

using namespace mutants;
using llvm::StringRef;

static bool isIdentStart(char c) {
  return llvm::isAlpha(c) || c == '_' || static_cast<unsigned char>(c) >= 0x80;
}

static bool isIdentContinue(char c) {
  return llvm::isAlnum(c) || c == '_' || static_cast<unsigned char>(c) >= 0x80;
}

/// Return the length in bytes of the UTF-8 sequence starting with \p lead.
static size_t getUTF8Length(char lead) {
  auto byte = static_cast<unsigned char>(lead);
  if (byte < 0x80)
    return 1;
  if ((byte & 0xE0) == 0xC0)
    return 2;
  if ((byte & 0xF0) == 0xE0)
    return 3;
  if ((byte & 0xF8) == 0xF0)
    return 4;
  return 1;
}

namespace {

class RustLexer {
public:
  RustLexer(StringRef text, StringRef filename)
      : text(text), filename(filename) {}

  llvm::Error lex(std::vector<Token> &tokens);

private:
  char peek(size_t ahead = 0) const {
    return pos + ahead < text.size() ? text[pos + ahead] : '\0';
  }
  bool atEnd() const { return pos >= text.size(); }

  /// Advance one byte, keeping line and column in sync.
  void bump() {
    char c = text[pos++];
    if (c == '\n') {
      ++line;
      column = 1;
    } else if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
      ++column;
    }
  }
  void bump(size_t n) {
    for (size_t i = 0; i < n && !atEnd(); ++i)
      bump();
  }

  llvm::Error errorAt(unsigned errLine, unsigned errColumn,
                      const llvm::Twine &message) const {
    return makeScanError(message, filename, errLine, errColumn);
  }

  void skipLineComment() {
    while (!atEnd() && peek() != '\n')
      bump();
  }
  llvm::Error skipBlockComment();
  llvm::Error lexQuoted(char quote);
  llvm::Error lexRawString();
  llvm::Error lexQuote();
  void lexNumber();
  void lexIdentifier();

  /// Lex an identifier, or a literal that starts with an identifier-like
  /// prefix (b"", r#"", c"") or a raw identifier.
  llvm::Error lexWord(TokenKind &kind);

  StringRef text;
  StringRef filename;
  size_t pos = 0;
  unsigned line = 1;
  unsigned column = 1;
};

} // namespace

llvm::Error RustLexer::skipBlockComment() {
  unsigned startLine = line, startColumn = column;
  bump(2);
  unsigned depth = 1;
  while (!atEnd()) {
    if (peek() == '/' && peek(1) == '*') {
      bump(2);
      ++depth;
    } else if (peek() == '*' && peek(1) == '/') {
      bump(2);
      if (--depth == 0)
        return llvm::Error::success();
    } else {
      bump();
    }
  }
  return errorAt(startLine, startColumn, "unterminated block comment");
}

/// Lex a quoted literal starting at the opening quote.
llvm::Error RustLexer::lexQuoted(char quote) {
  unsigned startLine = line, startColumn = column;
  bump();
  while (!atEnd()) {
    char c = peek();
    if (c == '\\') {
      bump(2);
      continue;
    }
    bump();
    if (c == quote)
      return llvm::Error::success();
  }
  return errorAt(startLine, startColumn,
                 quote == '"' ? "unterminated string literal"
                              : "unterminated character literal");
}

/// Lex r#"..."# starting at the first '#' or '"' after the prefix.
llvm::Error RustLexer::lexRawString() {
  unsigned startLine = line, startColumn = column;
  size_t hashes = 0;
  while (peek() == '#') {
    ++hashes;
    bump();
  }
  if (peek() != '"')
    return errorAt(startLine, startColumn, "malformed raw string literal");
  bump();
  while (!atEnd()) {
    if (peek() == '"') {
      size_t n = 0;
      while (n < hashes && peek(1 + n) == '#')
        ++n;
      if (n == hashes) {
        bump(1 + hashes);
        return llvm::Error::success();
      }
    }
    bump();
  }
  return errorAt(startLine, startColumn, "unterminated raw string literal");
}

/// A quote starts either a character literal or a lifetime.
llvm::Error RustLexer::lexQuote() {
  unsigned startLine = line, startColumn = column;
  if (peek(1) == '\\')
    return lexQuoted('\'');

  size_t width = getUTF8Length(peek(1));
  if (pos + 1 < text.size() && peek(1 + width) == '\'' && peek(1) != '\n') {
    bump(2 + width);
    return llvm::Error::success();
  }
  if (isIdentStart(peek(1))) {
    bump();
    while (!atEnd() && isIdentContinue(peek()))
      bump();
    return llvm::Error::success();
  }
  return errorAt(startLine, startColumn, "unterminated character literal");
}

void RustLexer::lexNumber() {
  bool hex = peek() == '0' && (peek(1) == 'x' || peek(1) == 'X');
  while (!atEnd()) {
    char c = peek();
    if (isIdentContinue(c)) {
      bump();
      if (!hex && (c == 'e' || c == 'E') && (peek() == '+' || peek() == '-'))
        bump();
      continue;
    }
    // 1.5 but not 1..2 or 1.max(2)
    if (c == '.' && llvm::isDigit(peek(1)) && !hex) {
      bump();
      continue;
    }
    break;
  }
}

void RustLexer::lexIdentifier() {
  while (!atEnd() && isIdentContinue(peek()))
    bump();
}

llvm::Error RustLexer::lexWord(TokenKind &kind) {
  char c0 = peek(), c1 = peek(1), c2 = peek(2);
  kind = TokenKind::Literal;

  // Raw strings: r"", r#"", br"", cr"".
  if (c0 == 'r' && (c1 == '"' || (c1 == '#' && (c2 == '"' || c2 == '#')))) {
    bump();
    return lexRawString();
  }
  if ((c0 == 'b' || c0 == 'c') && c1 == 'r' && (c2 == '"' || c2 == '#')) {
    bump(2);
    return lexRawString();
  }
  // Byte and C strings, byte characters.
  if ((c0 == 'b' || c0 == 'c') && c1 == '"') {
    bump();
    return lexQuoted('"');
  }
  if (c0 == 'b' && c1 == '\'') {
    bump();
    return lexQuoted('\'');
  }

  kind = TokenKind::Ident;
  if (c0 == 'r' && c1 == '#' && isIdentStart(c2))
    bump(2);
  lexIdentifier();
  return llvm::Error::success();
}

llvm::Error RustLexer::lex(std::vector<Token> &tokens) {
  // A shebang line is not an inner attribute.
  if (text.startswith("#!") && !text.drop_front(2).ltrim().startswith("["))
    skipLineComment();

  while (true) {
    while (!atEnd() && llvm::isSpace(peek()))
      bump();

    Token token;
    token.offset = pos;
    token.line = line;
    token.column = column;

    if (atEnd()) {
      token.kind = TokenKind::Eof;
      token.text = text.substr(pos, 0);
      tokens.push_back(token);
      return llvm::Error::success();
    }

    char c = peek();
    if (c == '/' && peek(1) == '/') {
      skipLineComment();
      continue;
    }
    if (c == '/' && peek(1) == '*') {
      if (auto commentErr = skipBlockComment())
        return commentErr;
      continue;
    }

    if (isIdentStart(c)) {
      if (auto wordErr = lexWord(token.kind))
        return wordErr;
    } else if (llvm::isDigit(c)) {
      lexNumber();
      token.kind = TokenKind::Literal;
    } else if (c == '"') {
      if (auto strErr = lexQuoted('"'))
        return strErr;
      token.kind = TokenKind::Literal;
    } else if (c == '\'') {
      if (auto quoteErr = lexQuote())
        return quoteErr;
      token.kind = pos - token.offset > 1 && text[pos - 1] == '\''
                       ? TokenKind::Literal
                       : TokenKind::Lifetime;
    } else {
      token.kind = TokenKind::Punct;
      if ((c == '-' && peek(1) == '>') || (c == '=' && peek(1) == '>') ||
          (c == ':' && peek(1) == ':'))
        bump(2);
      else
        bump();
    }

    token.text = text.slice(token.offset, pos);
    tokens.push_back(token);
  }
}

llvm::Expected<std::vector<Token>> mutants::lexRust(StringRef text,
                                                    StringRef filename) {
  std::vector<Token> tokens;
  RustLexer lexer(text, filename);
  if (auto err = lexer.lex(tokens))
    return std::move(err);
  return std::move(tokens);
}
