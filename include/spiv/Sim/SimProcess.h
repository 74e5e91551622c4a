//===- SimProcess.h - Cooperative simulation process base -------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the base class of the bus components that run as
// scheduler processes. Each subclass is a state machine: `resume` is called
// whenever the last registered wait completes and registers the next one.
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_SIM_SIMPROCESS_H
#define SPIV_SIM_SIMPROCESS_H

#include "spiv/Sim/SignalHost.h"
#include <string>

namespace spiv {
namespace sim {

class SimProcess {
public:
  SimProcess(SignalHost &host, llvm::StringRef name)
      : host(host), name(name.str()) {}
  virtual ~SimProcess();

  SimProcess(const SimProcess &) = delete;
  SimProcess &operator=(const SimProcess &) = delete;

  /// Register the process with the host. The first `resume` happens in the
  /// next delta cycle.
  virtual void start();

  ProcessId getId() const { return pid; }
  llvm::StringRef getName() const { return name; }
  bool isStarted() const { return pid != InvalidProcessId; }

protected:
  /// Advance the state machine. Called by the scheduler.
  virtual void resume() = 0;

  void waitEdge(llvm::StringRef signal, EdgeType edge) {
    host.waitEdge(pid, signal, edge);
  }
  void waitFor(uint64_t femtoseconds) { host.waitDuration(pid, femtoseconds); }
  void waitForNs(uint64_t ns) { waitFor(nanoseconds(ns)); }
  void halt() { host.halt(pid); }

  SignalHost &host;

private:
  std::string name;
  ProcessId pid = InvalidProcessId;
};

} // namespace sim
} // namespace spiv

#endif // SPIV_SIM_SIMPROCESS_H
