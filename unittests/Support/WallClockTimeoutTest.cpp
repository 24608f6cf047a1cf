//===- WallClockTimeoutTest.cpp - Wall-clock timeout tests ------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutants/Support/WallClockTimeout.h"
#include "gtest/gtest.h"
#include <atomic>
#include <chrono>
#include <thread>

using namespace mutants;

TEST(WallClockTimeoutTest, FiresAfterBudget) {
  std::atomic<bool> fired{false};
  WallClockTimeout timeout(std::chrono::milliseconds(50),
                           [&]() { fired.store(true); });

  auto start = std::chrono::steady_clock::now();
  while (!fired.load()) {
    if (std::chrono::steady_clock::now() - start > std::chrono::seconds(5))
      break;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  EXPECT_TRUE(fired.load());
  EXPECT_TRUE(timeout.hasExpired());
  EXPECT_GE(timeout.getElapsed(), std::chrono::milliseconds(50));
}

TEST(WallClockTimeoutTest, CancelPreventsExpiry) {
  std::atomic<bool> fired{false};
  {
    WallClockTimeout timeout(std::chrono::milliseconds(200),
                             [&]() { fired.store(true); });
    timeout.cancel();
    EXPECT_FALSE(timeout.hasExpired());
  }

  std::this_thread::sleep_for(std::chrono::milliseconds(300));
  EXPECT_FALSE(fired.load());
}

TEST(WallClockTimeoutTest, ZeroBudgetNeverFires) {
  std::atomic<bool> fired{false};
  WallClockTimeout timeout(std::chrono::milliseconds(0),
                           [&]() { fired.store(true); });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_FALSE(fired.load());
  EXPECT_FALSE(timeout.hasExpired());
  EXPECT_EQ(timeout.getBudget().count(), 0);
}

TEST(WallClockTimeoutTest, CancelIsIdempotent) {
  WallClockTimeout timeout(std::chrono::milliseconds(1000), nullptr);
  timeout.cancel();
  timeout.cancel();
  EXPECT_FALSE(timeout.hasExpired());
}

TEST(WallClockTimeoutTest, CancelFromCallback) {
  std::atomic<WallClockTimeout *> self{nullptr};
  std::atomic<bool> fired{false};
  WallClockTimeout timeout(std::chrono::milliseconds(20), [&]() {
    while (!self.load())
      std::this_thread::yield();
    self.load()->cancel();
    fired.store(true);
  });
  self.store(&timeout);

  auto start = std::chrono::steady_clock::now();
  while (!fired.load()) {
    if (std::chrono::steady_clock::now() - start > std::chrono::seconds(5))
      break;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  // The helper thread is still joined when the timer goes out of scope.
  EXPECT_TRUE(fired.load());
  EXPECT_TRUE(timeout.hasExpired());
}
