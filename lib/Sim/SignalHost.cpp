//===- SignalHost.cpp - Signal access capability interface ----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Sim/SignalHost.h"
#include "llvm/Support/Debug.h"

#define DEBUG_TYPE "spiv-signal-host"

using namespace spiv;
using namespace spiv::sim;

SignalHost::~SignalHost() = default;

SignalId SchedulerSignalHost::declareSignal(llvm::StringRef name,
                                            uint32_t width) {
  return scheduler.registerSignal(name.str(), width);
}

void SchedulerSignalHost::writeSignal(llvm::StringRef name,
                                      const SignalValue &value) {
  SignalId id = scheduler.lookupSignal(name);
  if (id == InvalidSignalId)
    id = scheduler.registerSignal(name.str(), value.getWidth());
  scheduler.updateSignal(id, value);
}

SignalValue SchedulerSignalHost::readSignal(llvm::StringRef name) const {
  return scheduler.getSignalValue(scheduler.lookupSignal(name));
}

void SchedulerSignalHost::waitEdge(ProcessId pid, llvm::StringRef name,
                                   EdgeType edge) {
  SignalId id = scheduler.lookupSignal(name);
  if (id == InvalidSignalId)
    id = scheduler.registerSignal(name.str());

  SensitivityList waitList;
  waitList.addEdge(id, edge);
  scheduler.suspendProcessForEvents(pid, waitList);
}

void SchedulerSignalHost::waitDuration(ProcessId pid, uint64_t femtoseconds) {
  scheduler.suspendProcess(pid,
                           scheduler.getCurrentTime().advanceTime(femtoseconds));
}

ProcessId SchedulerSignalHost::spawn(llvm::StringRef name,
                                     Process::ExecuteCallback callback) {
  return scheduler.registerProcess(name.str(), std::move(callback));
}

void SchedulerSignalHost::wake(ProcessId pid) {
  LLVM_DEBUG(llvm::dbgs() << "wake " << pid << " at "
                          << scheduler.getCurrentTime() << "\n");
  scheduler.resumeProcess(pid);
}

void SchedulerSignalHost::halt(ProcessId pid) {
  scheduler.terminateProcess(pid);
}

SimTime SchedulerSignalHost::now() const { return scheduler.getCurrentTime(); }
