//===- WallClockTimeout.cpp - Wall-clock timeout helper -------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "mutants/Support/WallClockTimeout.h"

using namespace mutants;

WallClockTimeout::WallClockTimeout(std::chrono::milliseconds budget,
                                   Callback onExpiry)
    : budget(budget), onExpiry(std::move(onExpiry)),
      armedAt(std::chrono::steady_clock::now()) {
  if (budget.count() <= 0)
    return;
  helper = std::thread([this]() { waitForExpiry(); });
}

WallClockTimeout::~WallClockTimeout() { cancel(); }

void WallClockTimeout::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    disarmed.store(true);
  }
  cv.notify_all();
  if (helper.joinable() && helper.get_id() != std::this_thread::get_id())
    helper.join();
}

void WallClockTimeout::waitForExpiry() {
  std::unique_lock<std::mutex> lock(mutex);
  if (cv.wait_until(lock, armedAt + budget,
                    [this]() { return disarmed.load(); }))
    return;
  expired.store(true);
  lock.unlock();
  if (onExpiry)
    onExpiry();
}
