//===- MutantsErrorTest.cpp - Unit tests for MutantsError -----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutants/Support/MutantsError.h"
#include "gtest/gtest.h"

using namespace mutants;

namespace {

TEST(MutantsErrorTest, MessageWithoutLocation) {
  llvm::Error err = makeError(ErrorKind::Toolchain, "cargo: not found");
  EXPECT_EQ(llvm::toString(std::move(err)), "cargo: not found");
}

TEST(MutantsErrorTest, MessageWithLocation) {
  llvm::Error err = makeScanError("unterminated string", "src/lib.rs", 3, 9);
  EXPECT_EQ(llvm::toString(std::move(err)),
            "src/lib.rs:3:9: unterminated string");
}

TEST(MutantsErrorTest, TakeErrorKind) {
  std::string message;
  ErrorKind kind =
      takeErrorKind(makeError(ErrorKind::Isolation, "disk full"), message);
  EXPECT_EQ(kind, ErrorKind::Isolation);
  EXPECT_EQ(message, "disk full");
}

TEST(MutantsErrorTest, ForeignErrorUsesFallback) {
  std::string message;
  ErrorKind kind = takeErrorKind(
      llvm::createStringError(std::errc::io_error, "plain failure"), message,
      ErrorKind::Config);
  EXPECT_EQ(kind, ErrorKind::Config);
  EXPECT_EQ(message, "plain failure");
}

TEST(MutantsErrorTest, HandleErrorsDiscriminatesKind) {
  bool sawScan = false;
  llvm::Error rest = llvm::handleErrors(
      makeScanError("bad token", "src/a.rs", 1, 1),
      [&](const MutantsError &e) -> llvm::Error {
        if (e.getKind() == ErrorKind::Scan) {
          sawScan = true;
          return llvm::Error::success();
        }
        return makeError(e.getKind(), e.getMessage());
      });
  EXPECT_FALSE(static_cast<bool>(rest));
  EXPECT_TRUE(sawScan);
}

TEST(MutantsErrorTest, RecoverableKinds) {
  EXPECT_TRUE(isRecoverable(ErrorKind::Scan));
  EXPECT_TRUE(isRecoverable(ErrorKind::Isolation));
  EXPECT_FALSE(isRecoverable(ErrorKind::Toolchain));
  EXPECT_FALSE(isRecoverable(ErrorKind::BaselineBroken));
  EXPECT_FALSE(isRecoverable(ErrorKind::Config));
  EXPECT_EQ(getErrorKindName(ErrorKind::BaselineBroken), "baseline");
}

TEST(MutantsErrorTest, JoinedErrorKeepsStructuralKind) {
  std::string message;
  ErrorKind kind = takeErrorKind(
      llvm::joinErrors(
          makeError(ErrorKind::Toolchain, "cannot find program 'cargo'"),
          makeError(ErrorKind::Isolation, "cannot restore src/lib.rs")),
      message);
  EXPECT_EQ(kind, ErrorKind::Toolchain);
  EXPECT_EQ(message,
            "cannot find program 'cargo'; cannot restore src/lib.rs");

  kind = takeErrorKind(
      llvm::joinErrors(
          makeError(ErrorKind::Isolation, "cannot restore src/lib.rs"),
          makeError(ErrorKind::Toolchain, "cannot find program 'cargo'")),
      message);
  EXPECT_EQ(kind, ErrorKind::Toolchain);
}

TEST(MutantsErrorTest, JoinedRecoverableErrorsKeepFirstKind) {
  std::string message;
  ErrorKind kind = takeErrorKind(
      llvm::joinErrors(makeError(ErrorKind::Isolation, "stale span"),
                       makeScanError("bad token", "src/a.rs", 1, 2)),
      message);
  EXPECT_EQ(kind, ErrorKind::Isolation);
  EXPECT_EQ(message, "stale span; src/a.rs:1:2: bad token");
}

} // namespace
