//===- SignalHost.h - Signal access capability interface --------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the capability interface through which bus components
// reach the simulation environment: writing and reading named signals,
// waiting for edges and durations, and spawning and waking processes.
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_SIM_SIGNALHOST_H
#define SPIV_SIM_SIGNALHOST_H

#include "spiv/Sim/ProcessScheduler.h"
#include "llvm/ADT/StringRef.h"

namespace spiv {
namespace sim {

/// The simulation environment as seen by the verification components. All
/// waits are registered for a process and take effect when the process
/// returns to the scheduler.
class SignalHost {
public:
  virtual ~SignalHost();

  /// Drive a signal. Unknown names declare a one-bit signal.
  virtual void writeSignal(llvm::StringRef name, const SignalValue &value) = 0;

  /// Read the current value of a signal. Unknown signals read as X.
  virtual SignalValue readSignal(llvm::StringRef name) const = 0;

  /// Resume `pid` on the next edge of the given type on `name`.
  virtual void waitEdge(ProcessId pid, llvm::StringRef name, EdgeType edge) = 0;

  /// Resume `pid` after `femtoseconds` of simulated time.
  virtual void waitDuration(ProcessId pid, uint64_t femtoseconds) = 0;

  /// Create a process. It first runs in the next delta cycle.
  virtual ProcessId spawn(llvm::StringRef name,
                          Process::ExecuteCallback callback) = 0;

  /// Schedule a sleeping process to run in the current time step.
  virtual void wake(ProcessId pid) = 0;

  /// Stop a process for good.
  virtual void halt(ProcessId pid) = 0;

  /// The current simulation time.
  virtual SimTime now() const = 0;

  /// Drive a one-bit signal to 0 or 1.
  void writeBit(llvm::StringRef name, bool bit) {
    writeSignal(name, SignalValue(bit ? 1 : 0, 1));
  }

  /// Release a signal to the unknown state.
  void release(llvm::StringRef name) { writeSignal(name, SignalValue::makeX()); }
};

/// A SignalHost backed by the spiv process scheduler.
class SchedulerSignalHost : public SignalHost {
public:
  explicit SchedulerSignalHost(ProcessScheduler &scheduler)
      : scheduler(scheduler) {}

  /// Declare a signal of the given width ahead of its first use.
  SignalId declareSignal(llvm::StringRef name, uint32_t width = 1);

  void writeSignal(llvm::StringRef name, const SignalValue &value) override;
  SignalValue readSignal(llvm::StringRef name) const override;
  void waitEdge(ProcessId pid, llvm::StringRef name, EdgeType edge) override;
  void waitDuration(ProcessId pid, uint64_t femtoseconds) override;
  ProcessId spawn(llvm::StringRef name,
                  Process::ExecuteCallback callback) override;
  void wake(ProcessId pid) override;
  void halt(ProcessId pid) override;
  SimTime now() const override;

  ProcessScheduler &getScheduler() { return scheduler; }

private:
  ProcessScheduler &scheduler;
};

} // namespace sim
} // namespace spiv

#endif // SPIV_SIM_SIGNALHOST_H
