//===- RunWatchdog.h - Simulated and wall-clock run bounds ------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the watchdog bounding a verification run in simulated
// time and in wall-clock time. The wall-clock timer runs on a helper thread
// that only raises a flag; the flag is polled from the scheduler thread.
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_SIM_RUNWATCHDOG_H
#define SPIV_SIM_RUNWATCHDOG_H

#include "spiv/Sim/SimulationControl.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace spiv {
namespace sim {

class RunWatchdog {
public:
  /// A zero bound disables that bound.
  RunWatchdog(SimulationControl &control, uint64_t simTimeLimitFs,
              std::chrono::milliseconds wallClockLimit);
  ~RunWatchdog();

  RunWatchdog(const RunWatchdog &) = delete;
  RunWatchdog &operator=(const RunWatchdog &) = delete;

  /// Start the wall-clock timer.
  void arm();

  /// Stop the timer and join the helper thread.
  void cancel();

  /// Ask for the run to be stopped at the next check. Safe to call from any
  /// thread.
  void requestTimeout() { expired.store(true); }

  /// Poll the bounds. Reports the timeout through the run control the first
  /// time a bound is exceeded and returns true from then on.
  bool check(const SimTime &now);

  /// Return true if the timeout was reported.
  bool hasFired() const { return fired; }

  uint64_t getSimTimeLimit() const { return simTimeLimitFs; }

private:
  void run();

  SimulationControl &control;
  uint64_t simTimeLimitFs;
  std::chrono::milliseconds wallClockLimit;
  bool fired = false;

  std::atomic<bool> stop{false};
  std::atomic<bool> expired{false};
  std::mutex mutex;
  std::condition_variable cv;
  std::thread worker;
};

} // namespace sim
} // namespace spiv

#endif // SPIV_SIM_RUNWATCHDOG_H
