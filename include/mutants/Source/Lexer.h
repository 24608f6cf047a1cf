//===- Lexer.h - Rust token stream ------------------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A lexer for Rust source text that is just precise enough to find item
// boundaries: comments and literals are recognized so that braces and angle
// brackets inside them are never mistaken for structure. Tokens are views into
// the original text.
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_SOURCE_LEXER_H
#define MUTANTS_SOURCE_LEXER_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"

#include <cstddef>
#include <vector>

namespace mutants {

enum class TokenKind {
  /// Identifiers and keywords, including raw identifiers (r#type).
  Ident,
  /// 'a, 'static
  Lifetime,
  /// Numbers, characters and all string forms.
  Literal,
  /// A punctuation character, or one of "->", "=>", "::".
  Punct,
  /// End of input; always the last token.
  Eof,
};

struct Token {
  TokenKind kind = TokenKind::Eof;
  llvm::StringRef text;
  /// Byte offset of the first character.
  size_t offset = 0;
  /// 1-based line and column; columns count characters, not bytes.
  unsigned line = 0;
  unsigned column = 0;

  bool is(TokenKind k) const { return kind == k; }
  bool isPunct(llvm::StringRef p) const {
    return kind == TokenKind::Punct && text == p;
  }
  bool isKeyword(llvm::StringRef word) const {
    return kind == TokenKind::Ident && text == word;
  }

  /// For identifiers, the name without any r# prefix.
  llvm::StringRef getIdentifier() const {
    llvm::StringRef name = text;
    name.consume_front("r#");
    return name;
  }

  size_t getEndOffset() const { return offset + text.size(); }
};

/// Split \p text into tokens, dropping whitespace and comments. The returned
/// tokens refer into \p text. A malformed literal or comment is reported as a
/// Scan error located in \p filename.
llvm::Expected<std::vector<Token>> lexRust(llvm::StringRef text,
                                           llvm::StringRef filename);

} // namespace mutants

#endif // MUTANTS_SOURCE_LEXER_H
