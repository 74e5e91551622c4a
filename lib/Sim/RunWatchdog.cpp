//===- RunWatchdog.cpp - Simulated and wall-clock run bounds --------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Sim/RunWatchdog.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/FormatVariadic.h"

#define DEBUG_TYPE "spiv-watchdog"

using namespace spiv;
using namespace spiv::sim;

RunWatchdog::RunWatchdog(SimulationControl &control, uint64_t simTimeLimitFs,
                         std::chrono::milliseconds wallClockLimit)
    : control(control), simTimeLimitFs(simTimeLimitFs),
      wallClockLimit(wallClockLimit) {}

RunWatchdog::~RunWatchdog() { cancel(); }

void RunWatchdog::arm() {
  if (wallClockLimit.count() == 0 || worker.joinable())
    return;
  stop.store(false);
  worker = std::thread([this]() { run(); });
}

void RunWatchdog::cancel() {
  stop.store(true);
  cv.notify_all();
  if (worker.joinable())
    worker.join();
}

void RunWatchdog::run() {
  std::unique_lock<std::mutex> lock(mutex);
  if (cv.wait_for(lock, wallClockLimit, [this]() { return stop.load(); }))
    return;
  expired.store(true);
}

bool RunWatchdog::check(const SimTime &now) {
  if (fired)
    return true;

  std::string reason;
  if (expired.load())
    reason = llvm::formatv("did not complete within bound: wall-clock limit "
                           "of {0} s exceeded",
                           wallClockLimit.count() / 1000.0)
                 .str();
  else if (simTimeLimitFs != 0 && now.realTime > simTimeLimitFs)
    reason = llvm::formatv("did not complete within bound: simulated time "
                           "limit of {0} ns exceeded",
                           simTimeLimitFs / kFemtosecondsPerNanosecond)
                 .str();
  else
    return false;

  LLVM_DEBUG(llvm::dbgs() << "Watchdog fired at " << now << "\n");
  fired = true;
  control.timeout(reason);
  return true;
}
