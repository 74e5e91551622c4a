//===- ProcessScheduler.h - Process scheduling for simulation ---*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the process scheduler of the spiv simulation kernel. It
// manages signals with an unknown (X) state, edge detection, and cooperative
// processes that wait either for signal edges or for simulated time.
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_SIM_PROCESSSCHEDULER_H
#define SPIV_SIM_PROCESSSCHEDULER_H

#include "spiv/Sim/EventQueue.h"
#include "llvm/ADT/APInt.h"
#include "llvm/ADT/DenseMap.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace spiv {
namespace sim {

//===----------------------------------------------------------------------===//
// ProcessState - Process execution states
//===----------------------------------------------------------------------===//

/// States that a simulation process can be in.
enum class ProcessState : uint8_t {
  /// Process has not yet been initialized.
  Uninitialized = 0,

  /// Process is ready to run but not currently executing.
  Ready = 1,

  /// Process is currently executing.
  Running = 2,

  /// Process is suspended waiting for a delay or an explicit wake-up.
  Suspended = 3,

  /// Process is waiting for a signal edge.
  Waiting = 4,

  /// Process has completed execution and will not run again.
  Terminated = 5,
};

/// Get the name of a process state for debugging.
inline const char *getProcessStateName(ProcessState state) {
  switch (state) {
  case ProcessState::Uninitialized:
    return "Uninitialized";
  case ProcessState::Ready:
    return "Ready";
  case ProcessState::Running:
    return "Running";
  case ProcessState::Suspended:
    return "Suspended";
  case ProcessState::Waiting:
    return "Waiting";
  case ProcessState::Terminated:
    return "Terminated";
  }
  return "Unknown";
}

//===----------------------------------------------------------------------===//
// EdgeType - Types of signal edge transitions
//===----------------------------------------------------------------------===//

/// Types of signal edge transitions for edge-sensitive waits.
enum class EdgeType : uint8_t {
  /// No edge.
  None = 0,

  /// Rising edge: 0->1, X->1.
  Posedge = 1,

  /// Falling edge: 1->0, X->0.
  Negedge = 2,

  /// Any value change.
  AnyEdge = 3,
};

/// Get the name of an edge type for debugging.
inline const char *getEdgeTypeName(EdgeType edge) {
  switch (edge) {
  case EdgeType::None:
    return "none";
  case EdgeType::Posedge:
    return "posedge";
  case EdgeType::Negedge:
    return "negedge";
  case EdgeType::AnyEdge:
    return "anyedge";
  }
  return "unknown";
}

//===----------------------------------------------------------------------===//
// SignalValue - Signal value with an unknown state
//===----------------------------------------------------------------------===//

/// A signal value of a fixed bit width that may be unknown (X). Single-bit
/// values drive the edge detection.
class SignalValue {
public:
  /// Default constructor creates an X (unknown) value.
  SignalValue() : value(1, 0), isX(true) {}

  /// Construct from an integer value.
  explicit SignalValue(uint64_t val, uint32_t w = 1)
      : value(w, val), isX(false) {}

  /// Construct from an APInt value.
  explicit SignalValue(llvm::APInt val) : value(std::move(val)), isX(false) {}

  /// Construct an X (unknown) value of the given width.
  static SignalValue makeX(uint32_t w = 1) {
    SignalValue sv;
    sv.value = llvm::APInt(w, 0);
    sv.isX = true;
    return sv;
  }

  /// Get the numeric value. Only meaningful when the value is known.
  uint64_t getValue() const { return value.getZExtValue(); }

  const llvm::APInt &getAPInt() const { return value; }

  uint32_t getWidth() const { return value.getBitWidth(); }

  /// Check if the value is unknown (X).
  bool isUnknown() const { return isX; }

  /// Get the LSB (for single-bit edge detection).
  bool getLSB() const { return value[0]; }

  /// Two X values compare equal; X never equals a known value.
  bool operator==(const SignalValue &other) const {
    if (isX && other.isX)
      return true;
    if (isX || other.isX)
      return false;
    return value == other.value;
  }
  bool operator!=(const SignalValue &other) const { return !(*this == other); }

  /// Detect the edge between an old and a new value.
  static EdgeType detectEdge(const SignalValue &oldVal,
                             const SignalValue &newVal) {
    if (oldVal == newVal)
      return EdgeType::None;

    if (newVal.isUnknown())
      return EdgeType::AnyEdge;
    if (oldVal.isUnknown())
      return newVal.getLSB() ? EdgeType::Posedge : EdgeType::Negedge;

    bool oldBit = oldVal.getLSB();
    bool newBit = newVal.getLSB();
    if (!oldBit && newBit)
      return EdgeType::Posedge;
    if (oldBit && !newBit)
      return EdgeType::Negedge;
    return EdgeType::AnyEdge;
  }

private:
  llvm::APInt value;
  bool isX;
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os,
                                     const SignalValue &value) {
  if (value.isUnknown())
    return os << "X";
  return os << value.getValue();
}

//===----------------------------------------------------------------------===//
// SensitivityList - Collection of trigger conditions
//===----------------------------------------------------------------------===//

using SignalId = uint64_t;

/// Invalid signal ID constant.
constexpr SignalId InvalidSignalId = 0;

/// A single trigger condition: an edge on a signal.
struct SensitivityEntry {
  SignalId signalId;
  EdgeType edge;

  SensitivityEntry(SignalId id, EdgeType e) : signalId(id), edge(e) {}
};

/// The edges a waiting process can be woken by.
class SensitivityList {
public:
  SensitivityList() = default;

  void addEdge(SignalId signalId, EdgeType edge) {
    entries.emplace_back(signalId, edge);
  }
  void addPosedge(SignalId signalId) { addEdge(signalId, EdgeType::Posedge); }
  void addNegedge(SignalId signalId) { addEdge(signalId, EdgeType::Negedge); }

  bool empty() const { return entries.empty(); }
  size_t size() const { return entries.size(); }
  void clear() { entries.clear(); }

  const llvm::SmallVector<SensitivityEntry, 2> &getEntries() const {
    return entries;
  }

  /// Check if an edge on a signal triggers this list.
  bool isTriggeredBy(SignalId signalId, EdgeType actualEdge) const {
    if (actualEdge == EdgeType::None)
      return false;
    for (const auto &entry : entries) {
      if (entry.signalId != signalId)
        continue;
      if (entry.edge == EdgeType::AnyEdge || entry.edge == actualEdge)
        return true;
    }
    return false;
  }

private:
  llvm::SmallVector<SensitivityEntry, 2> entries;
};

//===----------------------------------------------------------------------===//
// Process - Represents a simulation process
//===----------------------------------------------------------------------===//

using ProcessId = uint64_t;

/// Invalid process ID constant.
constexpr ProcessId InvalidProcessId = 0;

/// A simulation process. The callback runs every time the process is
/// resumed and must register its next wait before returning.
class Process {
public:
  using ExecuteCallback = std::function<void()>;

  Process(ProcessId id, std::string name, ExecuteCallback callback)
      : id(id), name(std::move(name)), callback(std::move(callback)),
        state(ProcessState::Uninitialized) {}

  ProcessId getId() const { return id; }
  const std::string &getName() const { return name; }

  ProcessState getState() const { return state; }
  void setState(ProcessState newState) { state = newState; }

  void execute() {
    if (callback)
      callback();
  }

  /// Mark the process as waiting for an edge.
  void setWaitingFor(const SensitivityList &waitList) {
    waitingSensitivity = waitList;
    state = ProcessState::Waiting;
  }

  const SensitivityList &getWaitingSensitivity() const {
    return waitingSensitivity;
  }

  /// Clear the waiting state.
  void clearWaiting() {
    waitingSensitivity.clear();
    if (state == ProcessState::Waiting)
      state = ProcessState::Ready;
  }

  /// Every new wait invalidates the timed wake-ups of earlier waits.
  uint64_t nextWaitToken() { return ++waitToken; }
  uint64_t getWaitToken() const { return waitToken; }

  bool inReadyQueue = false;

private:
  ProcessId id;
  std::string name;
  ExecuteCallback callback;
  ProcessState state;
  SensitivityList waitingSensitivity;
  uint64_t waitToken = 0;
};

//===----------------------------------------------------------------------===//
// ProcessScheduler - Main scheduler class
//===----------------------------------------------------------------------===//

/// The process scheduler: owns the signals and processes, triggers waiting
/// processes on signal edges and runs delta cycles until time advances.
class ProcessScheduler {
public:
  struct Config {
    /// Maximum number of delta cycles at one time step before giving up.
    size_t maxDeltaCycles;

    Config() : maxDeltaCycles(1000) {}
  };

  ProcessScheduler(Config config = Config());
  ~ProcessScheduler();

  ProcessScheduler(const ProcessScheduler &) = delete;
  ProcessScheduler &operator=(const ProcessScheduler &) = delete;

  //===--------------------------------------------------------------------===//
  // Process Management
  //===--------------------------------------------------------------------===//

  /// Register a new process. Processes registered after initialization are
  /// scheduled right away.
  ProcessId registerProcess(const std::string &name,
                            Process::ExecuteCallback callback);

  Process *getProcess(ProcessId id);
  const Process *getProcess(ProcessId id) const;

  size_t getNumProcesses() const { return processes.size(); }

  //===--------------------------------------------------------------------===//
  // Signal Management
  //===--------------------------------------------------------------------===//

  /// Register a signal. Signals start in the X state.
  SignalId registerSignal(const std::string &name, uint32_t width = 1);

  /// Find a signal by name. Returns InvalidSignalId if unknown.
  SignalId lookupSignal(llvm::StringRef name) const;

  llvm::StringRef getSignalName(SignalId signalId) const;

  /// Update a signal value, triggering processes waiting for its edges.
  void updateSignal(SignalId signalId, const SignalValue &newValue);

  /// Get the current value of a signal.
  const SignalValue &getSignalValue(SignalId signalId) const;

  //===--------------------------------------------------------------------===//
  // Process Execution Control
  //===--------------------------------------------------------------------===//

  /// Mark a process as ready to run in the current delta cycle.
  void scheduleProcess(ProcessId id,
                       SchedulingRegion region = SchedulingRegion::Active);

  /// Suspend a process until the specified time.
  void suspendProcess(ProcessId id, const SimTime &resumeTime);

  /// Suspend a process waiting for edges.
  void suspendProcessForEvents(ProcessId id, const SensitivityList &waitList);

  /// Terminate a process.
  void terminateProcess(ProcessId id);

  /// Resume a suspended or waiting process.
  void resumeProcess(ProcessId id);

  //===--------------------------------------------------------------------===//
  // Delta Cycle Execution
  //===--------------------------------------------------------------------===//

  /// Schedule every registered process for its first run.
  void initialize();

  /// Execute one delta cycle. Returns true if any process ran.
  bool executeDeltaCycle();

  /// Execute delta cycles until no process is ready. Returns the number of
  /// delta cycles executed.
  size_t executeCurrentTime();

  /// Run until no work is left, the abort callback fires or the next event
  /// lies beyond the time limit.
  SimTime runUntil(uint64_t maxTimeFemtoseconds);

  bool hasReadyProcesses() const;

  /// Check if no process is ready and no event is pending.
  bool isComplete() const;

  /// Install a predicate polled between process executions. When it returns
  /// true the scheduler stops.
  void setShouldAbortCallback(std::function<bool()> callback) {
    shouldAbortCallback = std::move(callback);
  }

  bool isAbortRequested() const;

  //===--------------------------------------------------------------------===//
  // Integration with EventScheduler
  //===--------------------------------------------------------------------===//

  EventScheduler &getEventScheduler() { return *eventScheduler; }
  const EventScheduler &getEventScheduler() const { return *eventScheduler; }

  const SimTime &getCurrentTime() const {
    return eventScheduler->getCurrentTime();
  }

  //===--------------------------------------------------------------------===//
  // Statistics
  //===--------------------------------------------------------------------===//

  struct Statistics {
    size_t processesRegistered = 0;
    size_t processesExecuted = 0;
    size_t deltaCyclesExecuted = 0;
    size_t signalUpdates = 0;
    size_t edgesDetected = 0;
    size_t maxDeltaCyclesReached = 0;
  };

  const Statistics &getStatistics() const { return stats; }

private:
  struct SignalState {
    std::string name;
    SignalValue value;
  };

  /// Schedule processes waiting for the edge of a signal.
  void triggerSensitiveProcesses(SignalId signalId, EdgeType edge);

  /// Execute processes in the ready queue for a specific region.
  size_t executeReadyProcesses(SchedulingRegion region);

  Config config;
  std::unique_ptr<EventScheduler> eventScheduler;

  llvm::DenseMap<ProcessId, std::unique_ptr<Process>> processes;
  std::vector<ProcessId> processOrder;
  ProcessId nextProcId = 1;

  // Index 0 is the invalid signal.
  std::vector<SignalState> signals;
  llvm::StringMap<SignalId> signalsByName;

  // Maps signals to processes that waited on them at least once.
  llvm::DenseMap<SignalId, llvm::SmallVector<ProcessId, 4>> signalToProcesses;

  std::vector<ProcessId>
      readyQueues[static_cast<size_t>(SchedulingRegion::NumRegions)];

  std::function<bool()> shouldAbortCallback;

  Statistics stats;
  bool initialized = false;

  static SignalValue unknownSignal;
};

} // namespace sim
} // namespace spiv

#endif // SPIV_SIM_PROCESSSCHEDULER_H
