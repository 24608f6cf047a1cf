//===- WallClockTimeout.h - Wall-clock timeout helper -----------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// A one-shot timer that runs a callback on a helper thread once a wall-clock
// budget has been used up. The phase runner arms one per subprocess and uses
// the callback to kill the subprocess's process group.
//
//===----------------------------------------------------------------------===//

#ifndef MUTANTS_SUPPORT_WALLCLOCKTIMEOUT_H
#define MUTANTS_SUPPORT_WALLCLOCKTIMEOUT_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace mutants {

class WallClockTimeout {
public:
  using Callback = std::function<void()>;

  /// Arm the timer. A zero budget never fires.
  WallClockTimeout(std::chrono::milliseconds budget, Callback onExpiry);
  ~WallClockTimeout();

  WallClockTimeout(const WallClockTimeout &) = delete;
  WallClockTimeout &operator=(const WallClockTimeout &) = delete;

  /// Disarm the timer and join the helper thread. If the callback is already
  /// running this waits for it to return. The callback itself may call
  /// cancel(), in which case the join is left to the destructor. The timer
  /// must not be destroyed from its callback.
  void cancel();

  /// Return true if the budget ran out and the callback was invoked.
  bool hasExpired() const { return expired.load(); }

  /// Return the configured budget.
  std::chrono::milliseconds getBudget() const { return budget; }

  /// Return the time elapsed since the timer was armed.
  std::chrono::steady_clock::duration getElapsed() const {
    return std::chrono::steady_clock::now() - armedAt;
  }

private:
  void waitForExpiry();

  std::chrono::milliseconds budget;
  Callback onExpiry;
  std::chrono::steady_clock::time_point armedAt;
  std::atomic<bool> disarmed{false};
  std::atomic<bool> expired{false};
  std::mutex mutex;
  std::condition_variable cv;
  std::thread helper;
};

} // namespace mutants

#endif // MUTANTS_SUPPORT_WALLCLOCKTIMEOUT_H
