//===- ProcessScheduler.cpp - Process scheduling for simulation -----------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements the process scheduler of the spiv simulation kernel.
//
//===----------------------------------------------------------------------===//

#include "spiv/Sim/ProcessScheduler.h"
#include "llvm/Support/Debug.h"
#include <algorithm>

#define DEBUG_TYPE "spiv-process-scheduler"

using namespace spiv;
using namespace spiv::sim;

SignalValue ProcessScheduler::unknownSignal = SignalValue::makeX();

//===----------------------------------------------------------------------===//
// ProcessScheduler Implementation
//===----------------------------------------------------------------------===//

ProcessScheduler::ProcessScheduler(Config config)
    : config(config), eventScheduler(std::make_unique<EventScheduler>()) {
  signals.push_back(SignalState{"<invalid>", SignalValue::makeX()});
  LLVM_DEBUG(llvm::dbgs() << "ProcessScheduler created with maxDeltaCycles="
                          << config.maxDeltaCycles << "\n");
}

ProcessScheduler::~ProcessScheduler() = default;

//===----------------------------------------------------------------------===//
// Process Management
//===----------------------------------------------------------------------===//

ProcessId ProcessScheduler::registerProcess(const std::string &name,
                                            Process::ExecuteCallback callback) {
  ProcessId id = nextProcId++;
  processes[id] = std::make_unique<Process>(id, name, std::move(callback));
  processOrder.push_back(id);
  ++stats.processesRegistered;

  LLVM_DEBUG(llvm::dbgs() << "Registered process '" << name << "' with ID "
                          << id << "\n");

  if (initialized)
    scheduleProcess(id, SchedulingRegion::Active);
  return id;
}

Process *ProcessScheduler::getProcess(ProcessId id) {
  auto it = processes.find(id);
  return it == processes.end() ? nullptr : it->second.get();
}

const Process *ProcessScheduler::getProcess(ProcessId id) const {
  auto it = processes.find(id);
  return it == processes.end() ? nullptr : it->second.get();
}

//===----------------------------------------------------------------------===//
// Signal Management
//===----------------------------------------------------------------------===//

SignalId ProcessScheduler::registerSignal(const std::string &name,
                                          uint32_t width) {
  auto it = signalsByName.find(name);
  if (it != signalsByName.end())
    return it->second;

  SignalId id = signals.size();
  signals.push_back(SignalState{name, SignalValue::makeX(width)});
  signalsByName[name] = id;

  LLVM_DEBUG(llvm::dbgs() << "Registered signal '" << name << "' (width "
                          << width << ") with ID " << id << "\n");
  return id;
}

SignalId ProcessScheduler::lookupSignal(llvm::StringRef name) const {
  auto it = signalsByName.find(name);
  return it == signalsByName.end() ? InvalidSignalId : it->second;
}

llvm::StringRef ProcessScheduler::getSignalName(SignalId signalId) const {
  if (signalId == InvalidSignalId || signalId >= signals.size())
    return "<unknown>";
  return signals[signalId].name;
}

void ProcessScheduler::updateSignal(SignalId signalId,
                                    const SignalValue &newValue) {
  if (signalId == InvalidSignalId || signalId >= signals.size()) {
    LLVM_DEBUG(llvm::dbgs() << "Warning: updating unknown signal " << signalId
                            << "\n");
    return;
  }
  auto &sigState = signals[signalId];

  // Values keep the width the signal was registered with.
  uint32_t width = sigState.value.getWidth();
  SignalValue normalized =
      newValue.isUnknown()
          ? SignalValue::makeX(width)
          : SignalValue(newValue.getAPInt().zextOrTrunc(width));

  SignalValue oldValue = sigState.value;
  sigState.value = normalized;
  ++stats.signalUpdates;

  EdgeType edge = SignalValue::detectEdge(oldValue, normalized);
  if (edge == EdgeType::None)
    return;

  ++stats.edgesDetected;
  LLVM_DEBUG(llvm::dbgs() << "Signal '" << sigState.name << "' " << oldValue
                          << " -> " << normalized
                          << " edge=" << getEdgeTypeName(edge) << " at "
                          << getCurrentTime() << "\n");
  triggerSensitiveProcesses(signalId, edge);
}

const SignalValue &ProcessScheduler::getSignalValue(SignalId signalId) const {
  if (signalId == InvalidSignalId || signalId >= signals.size())
    return unknownSignal;
  return signals[signalId].value;
}

void ProcessScheduler::triggerSensitiveProcesses(SignalId signalId,
                                                 EdgeType edge) {
  auto it = signalToProcesses.find(signalId);
  if (it == signalToProcesses.end())
    return;

  for (ProcessId procId : it->second) {
    Process *proc = getProcess(procId);
    if (!proc || proc->getState() != ProcessState::Waiting)
      continue;
    if (!proc->getWaitingSensitivity().isTriggeredBy(signalId, edge))
      continue;

    proc->clearWaiting();
    scheduleProcess(procId, SchedulingRegion::Active);
    LLVM_DEBUG(llvm::dbgs() << "Process " << procId << " ('"
                            << proc->getName() << "') triggered by "
                            << getEdgeTypeName(edge) << " "
                            << getSignalName(signalId) << "\n");
  }
}

//===----------------------------------------------------------------------===//
// Process Execution Control
//===----------------------------------------------------------------------===//

void ProcessScheduler::scheduleProcess(ProcessId id, SchedulingRegion region) {
  Process *proc = getProcess(id);
  if (!proc) {
    LLVM_DEBUG(llvm::dbgs() << "scheduleProcess(" << id
                            << "): process not found\n");
    return;
  }
  if (proc->getState() == ProcessState::Terminated || proc->inReadyQueue) {
    LLVM_DEBUG(llvm::dbgs() << "scheduleProcess(" << id << "): skipped, "
                            << getProcessStateName(proc->getState())
                            << (proc->inReadyQueue ? " and queued" : "")
                            << "\n");
    return;
  }

  readyQueues[static_cast<size_t>(region)].push_back(id);
  proc->inReadyQueue = true;
  proc->setState(ProcessState::Ready);
}

void ProcessScheduler::suspendProcess(ProcessId id, const SimTime &resumeTime) {
  Process *proc = getProcess(id);
  if (!proc || proc->getState() == ProcessState::Terminated)
    return;

  proc->setState(ProcessState::Suspended);
  uint64_t token = proc->nextWaitToken();

  eventScheduler->schedule(resumeTime, SchedulingRegion::Active,
                           Event([this, id, token]() {
                             Process *p = getProcess(id);
                             if (p && p->getWaitToken() == token)
                               resumeProcess(id);
                           }));

  LLVM_DEBUG(llvm::dbgs() << "Suspended process " << id
                          << " until time=" << resumeTime << "\n");
}

void ProcessScheduler::suspendProcessForEvents(
    ProcessId id, const SensitivityList &waitList) {
  Process *proc = getProcess(id);
  if (!proc || proc->getState() == ProcessState::Terminated)
    return;

  proc->nextWaitToken();
  proc->setWaitingFor(waitList);

  for (const auto &entry : waitList.getEntries()) {
    auto &procList = signalToProcesses[entry.signalId];
    if (std::find(procList.begin(), procList.end(), id) == procList.end())
      procList.push_back(id);
  }

  LLVM_DEBUG(llvm::dbgs() << "Process " << id << " waiting for "
                          << waitList.size() << " events\n");
}

void ProcessScheduler::terminateProcess(ProcessId id) {
  Process *proc = getProcess(id);
  if (!proc)
    return;
  LLVM_DEBUG(llvm::dbgs() << "Terminated process " << id << " (was "
                          << getProcessStateName(proc->getState()) << ")\n");
  proc->setState(ProcessState::Terminated);
  proc->nextWaitToken();
}

void ProcessScheduler::resumeProcess(ProcessId id) {
  Process *proc = getProcess(id);
  if (!proc || proc->getState() == ProcessState::Terminated)
    return;

  proc->clearWaiting();
  scheduleProcess(id, SchedulingRegion::Active);
  LLVM_DEBUG(llvm::dbgs() << "Resumed process " << id << "\n");
}

//===----------------------------------------------------------------------===//
// Delta Cycle Execution
//===----------------------------------------------------------------------===//

bool ProcessScheduler::isAbortRequested() const {
  return shouldAbortCallback && shouldAbortCallback();
}

void ProcessScheduler::initialize() {
  if (initialized)
    return;

  LLVM_DEBUG(llvm::dbgs() << "Initializing ProcessScheduler with "
                          << processes.size() << " processes\n");

  // Registration order is the order of the first run.
  for (ProcessId id : processOrder) {
    Process *proc = getProcess(id);
    if (proc && proc->getState() == ProcessState::Uninitialized)
      scheduleProcess(id, SchedulingRegion::Active);
  }
  initialized = true;
}

bool ProcessScheduler::executeDeltaCycle() {
  if (isAbortRequested())
    return false;
  if (!initialized)
    initialize();

  bool anyExecuted = false;
  for (size_t i = 0; i < static_cast<size_t>(SchedulingRegion::NumRegions);
       ++i) {
    size_t executed = executeReadyProcesses(static_cast<SchedulingRegion>(i));
    anyExecuted = anyExecuted || executed > 0;
  }

  if (anyExecuted)
    ++stats.deltaCyclesExecuted;
  return anyExecuted;
}

size_t ProcessScheduler::executeReadyProcesses(SchedulingRegion region) {
  auto &queue = readyQueues[static_cast<size_t>(region)];
  if (queue.empty())
    return 0;

  // Detach the queue so executing processes can schedule new work.
  std::vector<ProcessId> batch;
  std::swap(batch, queue);

  size_t executed = 0;
  for (ProcessId id : batch) {
    Process *proc = getProcess(id);
    if (!proc)
      continue;
    proc->inReadyQueue = false;

    if (isAbortRequested())
      break;
    if (proc->getState() == ProcessState::Terminated)
      continue;

    LLVM_DEBUG(llvm::dbgs() << "Executing process " << id << " ('"
                            << proc->getName() << "') in region "
                            << getSchedulingRegionName(region) << "\n");

    proc->setState(ProcessState::Running);
    proc->execute();
    ++stats.processesExecuted;
    ++executed;

    // A process that registered no wait sleeps until it is woken.
    if (proc->getState() == ProcessState::Running)
      proc->setState(ProcessState::Suspended);
  }
  return executed;
}

size_t ProcessScheduler::executeCurrentTime() {
  size_t totalDeltas = 0;
  while (hasReadyProcesses() && executeDeltaCycle()) {
    ++totalDeltas;
    if (totalDeltas >= config.maxDeltaCycles) {
      ++stats.maxDeltaCyclesReached;
      LLVM_DEBUG(llvm::dbgs() << "Warning: Max delta cycles reached ("
                              << config.maxDeltaCycles
                              << "). Possible infinite loop.\n");
      break;
    }
  }
  return totalDeltas;
}

SimTime ProcessScheduler::runUntil(uint64_t maxTimeFemtoseconds) {
  if (!initialized)
    initialize();

  while (!isAbortRequested()) {
    executeCurrentTime();
    if (isAbortRequested())
      break;

    // Delta follow-ups at the current time run before time moves on.
    auto next = eventScheduler->getNextEventTime();
    if (!next || next->realTime > maxTimeFemtoseconds)
      break;

    eventScheduler->advanceToNextTime();
    eventScheduler->stepDelta();
  }
  return getCurrentTime();
}

bool ProcessScheduler::hasReadyProcesses() const {
  for (const auto &queue : readyQueues)
    if (!queue.empty())
      return true;
  return false;
}

bool ProcessScheduler::isComplete() const {
  return !hasReadyProcesses() && eventScheduler->isComplete();
}
