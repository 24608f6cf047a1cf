//===- LexerTest.cpp - Unit tests for the Rust lexer ----------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutants/Source/Lexer.h"
#include "mutants/Support/MutantsError.h"
#include "gtest/gtest.h"

using namespace mutants;

namespace {

std::vector<Token> lexOrDie(llvm::StringRef text) {
  auto tokens = lexRust(text, "test.rs");
  EXPECT_TRUE(static_cast<bool>(tokens));
  if (!tokens) {
    llvm::consumeError(tokens.takeError());
    return {};
  }
  return std::move(*tokens);
}

std::vector<std::string> texts(const std::vector<Token> &tokens) {
  std::vector<std::string> out;
  for (const Token &token : tokens)
    if (!token.is(TokenKind::Eof))
      out.push_back(token.text.str());
  return out;
}

TEST(LexerTest, FunctionSignature) {
  auto tokens = lexOrDie("fn half(x: i64) -> i64 { x / 2 }");
  std::vector<std::string> expected = {"fn", "half", "(", "x", ":", "i64",
                                       ")",  "->",   "i64", "{", "x", "/",
                                       "2",  "}"};
  EXPECT_EQ(texts(tokens), expected);
  ASSERT_EQ(tokens.size(), expected.size() + 1);
  EXPECT_TRUE(tokens.back().is(TokenKind::Eof));

  const Token &brace = tokens[9];
  EXPECT_TRUE(brace.isPunct("{"));
  EXPECT_EQ(brace.line, 1u);
  EXPECT_EQ(brace.column, 24u);
  EXPECT_EQ(brace.offset, 23u);
}

TEST(LexerTest, CommentsAreDropped) {
  auto tokens = lexOrDie("a // { line\n/* { /* nested } */ } */ b");
  EXPECT_EQ(texts(tokens), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(tokens[1].line, 2u);
}

TEST(LexerTest, StringsHideBraces) {
  auto tokens = lexOrDie(R"(x("}", r#"a "}" b"#, b"{", '}', b'{'))");
  std::vector<std::string> expected = {"x",    "(", "\"}\"",
                                       ",",    "r#\"a \"}\" b\"#",
                                       ",",    "b\"{\"",
                                       ",",    "'}'",
                                       ",",    "b'{'",
                                       ")"};
  EXPECT_EQ(texts(tokens), expected);
  EXPECT_TRUE(tokens[2].is(TokenKind::Literal));
  EXPECT_TRUE(tokens[4].is(TokenKind::Literal));
  EXPECT_TRUE(tokens[8].is(TokenKind::Literal));
}

TEST(LexerTest, LifetimesAndCharacters) {
  auto tokens = lexOrDie("&'a str 'x' '\\n' 'static 'é'");
  ASSERT_EQ(tokens.size(), 8u);
  EXPECT_TRUE(tokens[1].is(TokenKind::Lifetime));
  EXPECT_EQ(tokens[1].text, "'a");
  EXPECT_TRUE(tokens[3].is(TokenKind::Literal));
  EXPECT_TRUE(tokens[4].is(TokenKind::Literal));
  EXPECT_TRUE(tokens[5].is(TokenKind::Lifetime));
  EXPECT_TRUE(tokens[6].is(TokenKind::Literal));
  EXPECT_EQ(tokens[6].text, "'é'");
}

TEST(LexerTest, ColumnsCountCharacters) {
  auto tokens = lexOrDie("\"héé\" x");
  ASSERT_EQ(tokens.size(), 3u);
  EXPECT_EQ(tokens[1].column, 7u);
  EXPECT_EQ(tokens[1].offset, 8u);
}

TEST(LexerTest, Numbers) {
  auto tokens = lexOrDie("1.5e-3 0xFF_u8 1..2 x.0");
  EXPECT_EQ(texts(tokens), (std::vector<std::string>{"1.5e-3", "0xFF_u8", "1",
                                                     ".", ".", "2", "x", ".",
                                                     "0"}));
}

TEST(LexerTest, CompoundPunctuation) {
  auto tokens = lexOrDie("a::b => c -> Vec<Vec<u8>>");
  EXPECT_EQ(texts(tokens),
            (std::vector<std::string>{"a", "::", "b", "=>", "c", "->", "Vec",
                                      "<", "Vec", "<", "u8", ">", ">"}));
}

TEST(LexerTest, RawIdentifier) {
  auto tokens = lexOrDie("fn r#type() {}");
  ASSERT_GE(tokens.size(), 2u);
  EXPECT_TRUE(tokens[1].is(TokenKind::Ident));
  EXPECT_EQ(tokens[1].text, "r#type");
  EXPECT_EQ(tokens[1].getIdentifier(), "type");
}

TEST(LexerTest, ShebangIsSkipped) {
  auto tokens = lexOrDie("#!/usr/bin/env run-cargo-script\nfn main() {}");
  EXPECT_EQ(tokens[0].text, "fn");

  auto attribute = lexOrDie("#![allow(dead_code)]");
  EXPECT_EQ(attribute[0].text, "#");
}

TEST(LexerTest, UnterminatedLiteralsAreScanErrors) {
  for (llvm::StringRef text :
       {"fn f() { \"open", "/* open", "r#\"open\"", "r##x"}) {
    auto tokens = lexRust(text, "bad.rs");
    ASSERT_FALSE(static_cast<bool>(tokens)) << text.str();
    std::string message;
    EXPECT_EQ(takeErrorKind(tokens.takeError(), message), ErrorKind::Scan);
    EXPECT_EQ(message.rfind("bad.rs:1:", 0), 0u) << message;
  }
}

} // namespace
