//===- Scanner.cpp - Find mutable functions in a Rust tree ----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// Item-level parsing of Rust sources. The parser recognizes only the items
// that can contain functions (fn, mod, impl, trait) and skips every other
// item by balancing delimiters, so unusual syntax elsewhere in a file does not
// stop the scan.
//
//===----------------------------------------------------------------------===//

#include "mutants/Source/Scanner.h"
#include "mutants/Source/Lexer.h"
#include "mutants/Support/MutantsError.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/GlobPattern.h"
#include "llvm/Support/Path.h"

#include <algorithm>

#define DEBUG_TYPE "mutants-scanner"

using namespace mutants;
using llvm::StringRef;

namespace posix = llvm::sys::path;

/// Remove all whitespace so that "cfg( test )" and "cfg(test)" compare equal.
static std::string squeeze(StringRef text) {
  std::string out;
  out.reserve(text.size());
  for (char c : text)
    if (!llvm::isSpace(c))
      out += c;
  return out;
}

/// Return the directory that holds the out-of-line children of \p relPath.
static std::string getChildDirectory(StringRef relPath) {
  StringRef dir = posix::parent_path(relPath, posix::Style::posix);
  StringRef stem = posix::stem(relPath, posix::Style::posix);
  if (stem == "lib" || stem == "main" || stem == "mod")
    return dir.str();
  if (dir.empty())
    return stem.str();
  return (dir + "/" + stem).str();
}

static std::string joinPath(StringRef dir, StringRef name) {
  if (dir.empty())
    return name.str();
  return (dir + "/" + name).str();
}

//===----------------------------------------------------------------------===//
// ItemParser
//===----------------------------------------------------------------------===//

namespace {

/// The naming and skipping context of a list of items.
struct Scope {
  /// Qualified-name components contributed by inline modules and impls.
  std::vector<std::string> names;
  /// Directory of the files declared by `mod name;` in this scope.
  std::string childDir;
  bool skipped = false;
};

class ItemParser {
public:
  ItemParser(const Scanner &scanner, StringRef relPath, StringRef text,
             StringRef modulePath, llvm::ArrayRef<Token> tokens,
             FileScan &result)
      : scanner(scanner), relPath(relPath), text(text), modulePath(modulePath),
        tokens(tokens), result(result) {}

  llvm::Error parseFile(Scope scope) {
    return parseItems(scope, /*inBraces=*/false);
  }

private:
  const Token &tok() const { return tokens[idx]; }
  const Token &lookahead(size_t n = 1) const {
    return tokens[std::min(idx + n, tokens.size() - 1)];
  }
  bool atEof() const { return tok().is(TokenKind::Eof); }

  llvm::Error errorAt(const Token &token, const llvm::Twine &message) const {
    return makeScanError(message, relPath, token.line, token.column);
  }

  llvm::Error parseItems(Scope &scope, bool inBraces);
  llvm::Error parseAttribute(bool &inner, std::string &attribute);
  llvm::Error parseFunction(const Scope &scope, bool skip, bool isUnsafe);
  llvm::Error parseModule(const Scope &scope, bool skip);
  llvm::Error parseImplOrTrait(const Scope &scope, bool skip, bool isTrait);
  llvm::Error skipItem();
  llvm::Error skipGroup();
  llvm::Error skipAngles();
  llvm::Error skipTypeUntilBody();

  std::string formatType(size_t begin, size_t end) const;
  std::string qualify(const Scope &scope, StringRef name) const;

  const Scanner &scanner;
  StringRef relPath;
  StringRef text;
  StringRef modulePath;
  llvm::ArrayRef<Token> tokens;
  FileScan &result;
  size_t idx = 0;
};

} // namespace

/// Skip a balanced (), [] or {} group starting at its opening token.
llvm::Error ItemParser::skipGroup() {
  const Token &open = tok();
  llvm::SmallVector<char, 8> closers;
  do {
    const Token &t = tok();
    if (t.is(TokenKind::Eof))
      return errorAt(open, "unclosed delimiter '" + open.text + "'");
    if (t.is(TokenKind::Punct)) {
      char c = t.text[0];
      if (t.text.size() == 1 && (c == '(' || c == '[' || c == '{')) {
        closers.push_back(c == '(' ? ')' : c == '[' ? ']' : '}');
      } else if (t.text.size() == 1 && (c == ')' || c == ']' || c == '}')) {
        if (closers.back() != c)
          return errorAt(t, "mismatched closing delimiter '" + t.text + "'");
        closers.pop_back();
      }
    }
    ++idx;
  } while (!closers.empty());
  return llvm::Error::success();
}

/// Skip a generic parameter or argument list starting at '<'.
llvm::Error ItemParser::skipAngles() {
  const Token &open = tok();
  unsigned depth = 0;
  do {
    const Token &t = tok();
    if (t.is(TokenKind::Eof))
      return errorAt(open, "unclosed generic parameter list");
    if (t.isPunct("(") || t.isPunct("[") || t.isPunct("{")) {
      if (auto err = skipGroup())
        return err;
      continue;
    }
    if (t.isPunct("<"))
      ++depth;
    else if (t.isPunct(">"))
      --depth;
    ++idx;
  } while (depth != 0);
  return llvm::Error::success();
}

/// Skip tokens of a type or where-clause up to a body '{' or ';' that is not
/// nested inside angle brackets.
llvm::Error ItemParser::skipTypeUntilBody() {
  unsigned depth = 0;
  while (true) {
    const Token &t = tok();
    if (t.is(TokenKind::Eof))
      return errorAt(t, "unexpected end of file in signature");
    if (depth == 0 &&
        (t.isPunct("{") || t.isPunct(";") || t.isKeyword("where")))
      return llvm::Error::success();
    if (t.isPunct("(") || t.isPunct("[") || t.isPunct("{")) {
      if (auto err = skipGroup())
        return err;
      continue;
    }
    if (t.isPunct("<"))
      ++depth;
    else if (t.isPunct(">") && depth > 0)
      --depth;
    ++idx;
  }
}

llvm::Error ItemParser::skipItem() {
  while (true) {
    const Token &t = tok();
    if (t.is(TokenKind::Eof) || t.isPunct("}"))
      return llvm::Error::success();
    if (t.isPunct(";")) {
      ++idx;
      return llvm::Error::success();
    }
    if (t.isPunct("{"))
      return skipGroup();
    if (t.isPunct("(") || t.isPunct("[")) {
      if (auto err = skipGroup())
        return err;
      continue;
    }
    ++idx;
  }
}

llvm::Error ItemParser::parseAttribute(bool &inner, std::string &attribute) {
  ++idx; // '#'
  inner = tok().isPunct("!");
  if (inner)
    ++idx;
  if (!tok().isPunct("["))
    return errorAt(tok(), "expected '[' after '#'");
  size_t open = idx;
  if (auto err = skipGroup())
    return err;
  attribute =
      squeeze(text.slice(tokens[open].getEndOffset(), tokens[idx - 1].offset));
  return llvm::Error::success();
}

std::string ItemParser::formatType(size_t begin, size_t end) const {
  auto isWord = [](const Token &t) {
    return t.is(TokenKind::Ident) || t.is(TokenKind::Lifetime) ||
           t.is(TokenKind::Literal);
  };
  auto needsSpace = [&](const Token &prev, const Token &cur) {
    if (isWord(prev) && isWord(cur))
      return true;
    if (prev.is(TokenKind::Lifetime))
      return !cur.isPunct(",") && !cur.isPunct(">");
    if (prev.isPunct(",") || prev.isPunct(";"))
      return true;
    for (StringRef op : {"=", "+", "->"})
      if (prev.isPunct(op) || cur.isPunct(op))
        return true;
    return prev.isKeyword("mut") || prev.isKeyword("dyn") ||
           prev.isKeyword("impl");
  };

  std::string out;
  for (size_t i = begin; i < end; ++i) {
    if (i != begin && needsSpace(tokens[i - 1], tokens[i]))
      out += ' ';
    out += tokens[i].text.str();
  }
  return out;
}

std::string ItemParser::qualify(const Scope &scope, StringRef name) const {
  std::string out = modulePath.str();
  auto append = [&](StringRef part) {
    if (!out.empty())
      out += "::";
    out += part.str();
  };
  for (const std::string &part : scope.names)
    append(part);
  append(name);
  return out;
}

llvm::Error ItemParser::parseFunction(const Scope &scope, bool skip,
                                      bool isUnsafe) {
  ++idx; // fn
  if (!tok().is(TokenKind::Ident))
    return errorAt(tok(), "expected function name");
  std::string name = tok().getIdentifier().str();
  ++idx;

  if (tok().isPunct("<"))
    if (auto err = skipAngles())
      return err;
  if (!tok().isPunct("("))
    return errorAt(tok(), "expected '(' after function name '" + name + "'");
  if (auto err = skipGroup())
    return err;

  std::string returnType;
  if (tok().isPunct("->")) {
    ++idx;
    size_t begin = idx;
    if (auto err = skipTypeUntilBody())
      return err;
    returnType = formatType(begin, idx);
  }
  if (returnType == "()")
    returnType.clear();

  if (tok().isKeyword("where")) {
    ++idx;
    if (auto err = skipTypeUntilBody())
      return err;
  }

  // Declarations without a body: trait methods, foreign functions.
  if (tok().isPunct(";")) {
    ++idx;
    return llvm::Error::success();
  }
  if (!tok().isPunct("{"))
    return errorAt(tok(), "expected body of function '" + name + "'");

  const Token &open = tok();
  size_t openIdx = idx;
  if (auto err = skipGroup())
    return err;
  const Token &close = tokens[idx - 1];
  bool emptyBody = idx - openIdx == 2;

  std::string qualified = qualify(scope, name);
  if (skip || isUnsafe || emptyBody || returnType == "!") {
    LLVM_DEBUG(llvm::dbgs() << relPath << ": not mutating " << qualified
                            << (skip       ? " (skip attribute)"
                                : isUnsafe ? " (unsafe)"
                                : emptyBody ? " (empty body)"
                                            : " (diverges)")
                            << "\n");
    return llvm::Error::success();
  }

  FunctionSite site;
  site.file = relPath.str();
  site.functionName = std::move(qualified);
  site.returnType = std::move(returnType);
  site.bodyStart = open.offset;
  site.bodyEnd = close.getEndOffset();
  site.line = open.line;
  site.column = open.column;
  result.sites.push_back(std::move(site));
  return llvm::Error::success();
}

llvm::Error ItemParser::parseModule(const Scope &scope, bool skip) {
  ++idx; // mod
  if (!tok().is(TokenKind::Ident))
    return errorAt(tok(), "expected module name");
  std::string name = tok().getIdentifier().str();
  ++idx;

  if (tok().isPunct(";")) {
    ++idx;
    std::string base = joinPath(scope.childDir, name);
    for (std::string path : {base + ".rs", base + "/mod.rs"}) {
      result.childFiles.push_back(path);
      if (skip)
        result.skippedFiles.push_back(path);
    }
    return llvm::Error::success();
  }
  if (!tok().isPunct("{"))
    return errorAt(tok(), "expected ';' or '{' after module '" + name + "'");
  ++idx;

  Scope child;
  child.names = scope.names;
  child.names.push_back(name);
  child.childDir = joinPath(scope.childDir, name);
  child.skipped = skip;
  return parseItems(child, /*inBraces=*/true);
}

llvm::Error ItemParser::parseImplOrTrait(const Scope &scope, bool skip,
                                         bool isTrait) {
  ++idx; // impl or trait
  std::string selfName;
  if (isTrait) {
    if (!tok().is(TokenKind::Ident))
      return errorAt(tok(), "expected trait name");
    selfName = tok().getIdentifier().str();
    ++idx;
  }
  if (tok().isPunct("<"))
    if (auto err = skipAngles())
      return err;

  // impl [Trait for] Type [where ...] {
  size_t typeBegin = idx;
  size_t typeEnd = 0;
  unsigned depth = 0;
  while (true) {
    const Token &t = tok();
    if (t.is(TokenKind::Eof))
      return errorAt(t, "unexpected end of file in impl header");
    if (depth == 0 && (t.isPunct("{") || t.isPunct(";")))
      break;
    if (t.isPunct("(") || t.isPunct("[")) {
      if (auto err = skipGroup())
        return err;
      continue;
    }
    if (t.isPunct("<"))
      ++depth;
    else if (t.isPunct(">") && depth > 0)
      --depth;
    else if (depth == 0 && !typeEnd && t.isKeyword("for") && !isTrait)
      typeBegin = idx + 1;
    else if (depth == 0 && !typeEnd && t.isKeyword("where"))
      typeEnd = idx;
    ++idx;
  }
  if (!typeEnd)
    typeEnd = idx;

  if (tok().isPunct(";")) {
    ++idx;
    return llvm::Error::success();
  }

  if (!isTrait) {
    // The self type is named by its last path segment outside generics:
    // `&'a mut fmt::Formatter<'b>` is "Formatter".
    unsigned angle = 0;
    for (size_t i = typeBegin; i < typeEnd; ++i) {
      const Token &t = tokens[i];
      if (t.isPunct("<"))
        ++angle;
      else if (t.isPunct(">") && angle > 0)
        --angle;
      else if (angle == 0 && t.is(TokenKind::Ident) && !t.isKeyword("mut") &&
               !t.isKeyword("dyn") && !t.isKeyword("const"))
        selfName = t.getIdentifier().str();
    }
    if (selfName.empty())
      selfName = formatType(typeBegin, typeEnd);
  }

  ++idx; // {
  Scope child;
  child.names = scope.names;
  child.names.push_back(selfName);
  child.childDir = scope.childDir;
  child.skipped = skip;
  return parseItems(child, /*inBraces=*/true);
}

llvm::Error ItemParser::parseItems(Scope &scope, bool inBraces) {
  while (true) {
    if (atEof()) {
      if (inBraces)
        return errorAt(tok(), "unexpected end of file, expected '}'");
      return llvm::Error::success();
    }
    if (tok().isPunct("}")) {
      if (!inBraces)
        return errorAt(tok(), "unexpected '}'");
      ++idx;
      return llvm::Error::success();
    }
    if (tok().isPunct(";")) {
      ++idx;
      continue;
    }

    bool skip = false;
    bool sawInner = false;
    while (tok().isPunct("#")) {
      bool inner;
      std::string attribute;
      if (auto err = parseAttribute(inner, attribute))
        return err;
      if (inner)
        sawInner = true;
      if (!scanner.isSkipAttribute(attribute))
        continue;
      if (inner) {
        scope.skipped = true;
        if (!inBraces)
          result.fileSkipped = true;
      } else {
        skip = true;
      }
    }
    if (sawInner && (atEof() || tok().isPunct("}")))
      continue;
    skip = skip || scope.skipped;

    if (tok().isKeyword("pub")) {
      ++idx;
      if (tok().isPunct("("))
        if (auto err = skipGroup())
          return err;
    }

    bool isUnsafe = false;
    while (true) {
      const Token &t = tok();
      const Token &next = lookahead();
      bool nextIsFnLike = next.isKeyword("fn") || next.isKeyword("unsafe") ||
                          next.isKeyword("async") || next.isKeyword("extern");
      if (t.isKeyword("const") && nextIsFnLike) {
        ++idx;
      } else if (t.isKeyword("async") && nextIsFnLike) {
        ++idx;
      } else if (t.isKeyword("unsafe")) {
        isUnsafe = true;
        ++idx;
      } else if (t.isKeyword("default") &&
                 (nextIsFnLike || next.isKeyword("const") ||
                  next.isKeyword("impl") || next.isKeyword("type"))) {
        ++idx;
      } else if (t.isKeyword("extern") && next.is(TokenKind::Literal) &&
                 lookahead(2).isKeyword("fn")) {
        idx += 2;
      } else if (t.isKeyword("extern") && next.isKeyword("fn")) {
        ++idx;
      } else {
        break;
      }
    }

    llvm::Error err = llvm::Error::success();
    const Token &t = tok();
    if (t.isKeyword("fn")) {
      err = parseFunction(scope, skip, isUnsafe);
    } else if (t.isKeyword("mod")) {
      err = parseModule(scope, skip);
    } else if (t.isKeyword("impl")) {
      err = parseImplOrTrait(scope, skip, /*isTrait=*/false);
    } else if (t.isKeyword("trait")) {
      err = parseImplOrTrait(scope, skip, /*isTrait=*/true);
    } else if (t.isKeyword("auto") && lookahead().isKeyword("trait")) {
      ++idx;
      err = parseImplOrTrait(scope, skip, /*isTrait=*/true);
    } else {
      err = skipItem();
    }
    if (err)
      return err;
  }
}

//===----------------------------------------------------------------------===//
// Scanner
//===----------------------------------------------------------------------===//

bool Scanner::isSkipAttribute(StringRef attribute) const {
  std::string attr = squeeze(attribute);
  StringRef text(attr);

  auto matches = [&](StringRef candidate) {
    for (const std::string &entry : config.skipAttributes) {
      std::string want = squeeze(entry);
      if (candidate == want ||
          (candidate.startswith(want) &&
           candidate.drop_front(want.size()).startswith("(")))
        return true;
    }
    return false;
  };
  if (matches(text))
    return true;

  // #[cfg_attr(test, mutants::skip)] applies the skip conditionally; treat it
  // as unconditional.
  if (text.consume_front("cfg_attr(") && text.consume_back(")")) {
    llvm::SmallVector<StringRef, 4> parts;
    text.split(parts, ',');
    for (StringRef part : llvm::drop_begin(parts))
      if (matches(part))
        return true;
  }
  return false;
}

bool Scanner::isGenerated(StringRef text) const {
  StringRef head = text;
  size_t pos = 0;
  for (unsigned line = 0; line < 10 && pos != StringRef::npos; ++line) {
    pos = text.find('\n', pos);
    if (pos != StringRef::npos)
      ++pos;
  }
  if (pos != StringRef::npos)
    head = text.take_front(pos);
  return llvm::any_of(config.generatedMarkers, [&](const std::string &marker) {
    return !marker.empty() && head.contains(marker);
  });
}

bool Scanner::isFileSelected(StringRef relPath) const {
  auto matchesAny = [&](const std::vector<std::string> &patterns) {
    for (const std::string &pattern : patterns) {
      auto glob = llvm::GlobPattern::create(pattern);
      if (!glob) {
        // Malformed patterns are rejected by MutantsConfig::validate().
        llvm::consumeError(glob.takeError());
        continue;
      }
      if (glob->match(relPath))
        return true;
      // A pattern without a slash matches the file name anywhere.
      if (StringRef(pattern).find('/') == StringRef::npos &&
          glob->match(posix::filename(relPath, posix::Style::posix)))
        return true;
    }
    return false;
  };

  if (!config.includeFiles.empty() && !matchesAny(config.includeFiles))
    return false;
  return !matchesAny(config.excludeFiles);
}

std::string
Scanner::getModulePathForFile(StringRef relPath,
                              llvm::ArrayRef<std::string> sourceDirs) {
  StringRef path = relPath;
  size_t bestLength = 0;
  for (const std::string &dir : sourceDirs) {
    StringRef prefix = StringRef(dir).rtrim('/');
    if (prefix.size() > bestLength && path.startswith(prefix) &&
        path.drop_front(prefix.size()).startswith("/"))
      bestLength = prefix.size() + 1;
  }
  path = path.drop_front(bestLength);
  path.consume_back(".rs");

  llvm::SmallVector<StringRef, 4> parts;
  path.split(parts, '/', -1, /*KeepEmpty=*/false);
  StringRef last = parts.empty() ? StringRef() : parts.back();
  if (last == "lib" || last == "main" || last == "mod")
    parts.pop_back();
  return llvm::join(parts, "::");
}

llvm::Expected<std::vector<std::string>>
Scanner::discoverFiles(StringRef root) const {
  std::vector<std::string> files;
  for (const std::string &dir : config.sourceDirs) {
    llvm::SmallString<256> base(root);
    posix::append(base, dir);
    if (!llvm::sys::fs::is_directory(base)) {
      LLVM_DEBUG(llvm::dbgs() << "source directory " << base
                              << " does not exist\n");
      continue;
    }

    std::error_code ec;
    for (llvm::sys::fs::recursive_directory_iterator
             it(base, ec, /*follow_symlinks=*/false),
         end;
         it != end && !ec; it.increment(ec)) {
      StringRef path = it->path();
      if (it->type() == llvm::sys::fs::file_type::directory_file) {
        StringRef name = posix::filename(path);
        if (name == "target" || name.startswith("."))
          it.no_push();
        continue;
      }
      if (posix::extension(path) != ".rs")
        continue;

      llvm::SmallString<128> rel(path.drop_front(root.size()));
      posix::native(rel, posix::Style::posix);
      StringRef relRef = StringRef(rel).ltrim('/');
      if (!isFileSelected(relRef)) {
        LLVM_DEBUG(llvm::dbgs() << "excluded by file filters: " << relRef
                                << "\n");
        continue;
      }
      files.push_back(relRef.str());
    }
    if (ec)
      return makeError(ErrorKind::Scan,
                       "failed to list " + base.str() + ": " + ec.message());
  }

  llvm::sort(files);
  files.erase(std::unique(files.begin(), files.end()), files.end());
  return std::move(files);
}

llvm::Expected<FileScan> Scanner::scanFile(StringRef relPath,
                                           StringRef text) const {
  auto tokens = lexRust(text, relPath);
  if (!tokens)
    return tokens.takeError();

  FileScan result;
  std::string modulePath = getModulePathForFile(relPath, config.sourceDirs);
  ItemParser parser(*this, relPath, text, modulePath, *tokens, result);

  Scope scope;
  scope.childDir = getChildDirectory(relPath);
  if (auto err = parser.parseFile(std::move(scope)))
    return std::move(err);

  LLVM_DEBUG(llvm::dbgs() << relPath << ": " << result.sites.size()
                          << " mutable functions\n");
  return std::move(result);
}
