//===----------------------------------------------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Sim/ProcessScheduler.h"
#include "gtest/gtest.h"
#include <vector>

using namespace spiv;
using namespace spiv::sim;

namespace {

//===----------------------------------------------------------------------===//
// ProcessState / EdgeType Tests
//===----------------------------------------------------------------------===//

TEST(ProcessState, StateNames) {
  EXPECT_STREQ(getProcessStateName(ProcessState::Uninitialized),
               "Uninitialized");
  EXPECT_STREQ(getProcessStateName(ProcessState::Ready), "Ready");
  EXPECT_STREQ(getProcessStateName(ProcessState::Running), "Running");
  EXPECT_STREQ(getProcessStateName(ProcessState::Suspended), "Suspended");
  EXPECT_STREQ(getProcessStateName(ProcessState::Waiting), "Waiting");
  EXPECT_STREQ(getProcessStateName(ProcessState::Terminated), "Terminated");
}

TEST(EdgeType, EdgeNames) {
  EXPECT_STREQ(getEdgeTypeName(EdgeType::Posedge), "posedge");
  EXPECT_STREQ(getEdgeTypeName(EdgeType::Negedge), "negedge");
}

//===----------------------------------------------------------------------===//
// SignalValue Tests
//===----------------------------------------------------------------------===//

TEST(SignalValue, DefaultIsUnknown) {
  SignalValue sv;
  EXPECT_TRUE(sv.isUnknown());
  EXPECT_EQ(sv.getWidth(), 1u);

  SignalValue wide = SignalValue::makeX(16);
  EXPECT_TRUE(wide.isUnknown());
  EXPECT_EQ(wide.getWidth(), 16u);
}

TEST(SignalValue, Equality) {
  SignalValue a(1, 1);
  SignalValue b(1, 1);
  SignalValue c(0, 1);

  EXPECT_TRUE(a == b);
  EXPECT_FALSE(a == c);
  EXPECT_TRUE(SignalValue::makeX() == SignalValue::makeX());
  EXPECT_FALSE(a == SignalValue::makeX());
}

TEST(SignalValue, DetectEdge) {
  SignalValue zero(0, 1);
  SignalValue one(1, 1);
  SignalValue x = SignalValue::makeX();

  EXPECT_EQ(SignalValue::detectEdge(zero, one), EdgeType::Posedge);
  EXPECT_EQ(SignalValue::detectEdge(one, zero), EdgeType::Negedge);
  EXPECT_EQ(SignalValue::detectEdge(one, one), EdgeType::None);

  // Leaving X counts as an edge towards the new level.
  EXPECT_EQ(SignalValue::detectEdge(x, one), EdgeType::Posedge);
  EXPECT_EQ(SignalValue::detectEdge(x, zero), EdgeType::Negedge);
  EXPECT_EQ(SignalValue::detectEdge(one, x), EdgeType::AnyEdge);
  EXPECT_EQ(SignalValue::detectEdge(x, x), EdgeType::None);
}

TEST(SignalValue, DetectEdgeMultiBit) {
  SignalValue a(0x55, 8);
  SignalValue b(0x56, 8);
  SignalValue c(0x54, 8);

  EXPECT_EQ(SignalValue::detectEdge(a, b), EdgeType::Negedge);
  EXPECT_EQ(SignalValue::detectEdge(b, c), EdgeType::AnyEdge);
}

TEST(SensitivityList, Triggering) {
  SensitivityList list;
  EXPECT_TRUE(list.empty());
  list.addPosedge(1);
  list.addEdge(2, EdgeType::AnyEdge);
  EXPECT_EQ(list.size(), 2u);

  EXPECT_TRUE(list.isTriggeredBy(1, EdgeType::Posedge));
  EXPECT_FALSE(list.isTriggeredBy(1, EdgeType::Negedge));
  EXPECT_TRUE(list.isTriggeredBy(2, EdgeType::Negedge));
  EXPECT_FALSE(list.isTriggeredBy(2, EdgeType::None));
  EXPECT_FALSE(list.isTriggeredBy(3, EdgeType::Posedge));
}

//===----------------------------------------------------------------------===//
// ProcessScheduler Tests
//===----------------------------------------------------------------------===//

TEST(ProcessScheduler, RegisterSignals) {
  ProcessScheduler scheduler;
  SignalId clk = scheduler.registerSignal("clk");
  SignalId bus = scheduler.registerSignal("bus", 8);

  EXPECT_NE(clk, InvalidSignalId);
  EXPECT_NE(clk, bus);
  EXPECT_EQ(scheduler.registerSignal("clk"), clk);
  EXPECT_EQ(scheduler.lookupSignal("bus"), bus);
  EXPECT_EQ(scheduler.lookupSignal("nope"), InvalidSignalId);
  EXPECT_EQ(scheduler.getSignalName(bus), "bus");
  EXPECT_TRUE(scheduler.getSignalValue(clk).isUnknown());
  EXPECT_TRUE(scheduler.getSignalValue(InvalidSignalId).isUnknown());
}

TEST(ProcessScheduler, UpdateSignalKeepsWidth) {
  ProcessScheduler scheduler;
  SignalId bus = scheduler.registerSignal("bus", 4);

  scheduler.updateSignal(bus, SignalValue(0x1F, 8));
  EXPECT_EQ(scheduler.getSignalValue(bus).getWidth(), 4u);
  EXPECT_EQ(scheduler.getSignalValue(bus).getValue(), 0xFu);
  EXPECT_EQ(scheduler.getStatistics().signalUpdates, 1u);
}

TEST(ProcessScheduler, InitializeRunsInRegistrationOrder) {
  ProcessScheduler scheduler;
  std::vector<int> order;

  scheduler.registerProcess("a", [&order]() { order.push_back(1); });
  scheduler.registerProcess("b", [&order]() { order.push_back(2); });
  scheduler.registerProcess("c", [&order]() { order.push_back(3); });
  EXPECT_EQ(scheduler.getNumProcesses(), 3u);

  scheduler.initialize();
  EXPECT_TRUE(scheduler.executeDeltaCycle());

  ASSERT_EQ(order.size(), 3u);
  EXPECT_EQ(order[0], 1);
  EXPECT_EQ(order[1], 2);
  EXPECT_EQ(order[2], 3);

  // Processes with no pending wait sleep until woken.
  EXPECT_FALSE(scheduler.hasReadyProcesses());
  EXPECT_TRUE(scheduler.isComplete());
}

TEST(ProcessScheduler, EdgeWakesWaitingProcess) {
  ProcessScheduler scheduler;
  SignalId clk = scheduler.registerSignal("clk");
  int wakeups = 0;

  ProcessId pid = InvalidProcessId;
  pid = scheduler.registerProcess("waiter", [&]() {
    ++wakeups;
    SensitivityList list;
    list.addPosedge(clk);
    scheduler.suspendProcessForEvents(pid, list);
  });

  scheduler.initialize();
  scheduler.executeCurrentTime();
  EXPECT_EQ(wakeups, 1);
  EXPECT_EQ(scheduler.getProcess(pid)->getState(), ProcessState::Waiting);

  // X -> 0 is a falling edge and must not wake a posedge waiter.
  scheduler.updateSignal(clk, SignalValue(0, 1));
  scheduler.executeCurrentTime();
  EXPECT_EQ(wakeups, 1);

  scheduler.updateSignal(clk, SignalValue(1, 1));
  scheduler.executeCurrentTime();
  EXPECT_EQ(wakeups, 2);
  EXPECT_EQ(scheduler.getStatistics().edgesDetected, 2u);
}

TEST(ProcessScheduler, TimedSuspension) {
  ProcessScheduler scheduler;
  std::vector<uint64_t> times;

  ProcessId pid = InvalidProcessId;
  pid = scheduler.registerProcess("ticker", [&]() {
    times.push_back(scheduler.getCurrentTime().realTime);
    if (times.size() < 4)
      scheduler.suspendProcess(
          pid, scheduler.getCurrentTime().advanceTime(nanoseconds(10)));
  });

  SimTime end = scheduler.runUntil(nanoseconds(1000));
  ASSERT_EQ(times.size(), 4u);
  EXPECT_EQ(times[0], 0u);
  EXPECT_EQ(times[1], nanoseconds(10));
  EXPECT_EQ(times[3], nanoseconds(30));
  EXPECT_EQ(end.realTime, nanoseconds(30));
  EXPECT_TRUE(scheduler.isComplete());
}

TEST(ProcessScheduler, NewWaitCancelsTimedWakeup) {
  ProcessScheduler scheduler;
  SignalId go = scheduler.registerSignal("go");
  int runs = 0;

  ProcessId pid = InvalidProcessId;
  pid = scheduler.registerProcess("p", [&]() {
    ++runs;
    if (runs == 1) {
      scheduler.suspendProcess(pid, SimTime(nanoseconds(100)));
      // Replace the timed wait by an edge wait.
      SensitivityList list;
      list.addPosedge(go);
      scheduler.suspendProcessForEvents(pid, list);
    }
  });

  scheduler.runUntil(nanoseconds(500));
  EXPECT_EQ(runs, 1);
}

TEST(ProcessScheduler, ResumeIsDeduplicated) {
  ProcessScheduler scheduler;
  int runs = 0;
  ProcessId pid = scheduler.registerProcess("p", [&runs]() { ++runs; });

  scheduler.initialize();
  scheduler.executeCurrentTime();
  EXPECT_EQ(runs, 1);

  scheduler.resumeProcess(pid);
  scheduler.resumeProcess(pid);
  scheduler.executeCurrentTime();
  EXPECT_EQ(runs, 2);
}

TEST(ProcessScheduler, TerminatedProcessNeverRuns) {
  ProcessScheduler scheduler;
  int runs = 0;

  ProcessId pid = InvalidProcessId;
  pid = scheduler.registerProcess("p", [&]() {
    ++runs;
    scheduler.suspendProcess(pid, SimTime(nanoseconds(5)));
  });

  scheduler.initialize();
  scheduler.executeCurrentTime();
  scheduler.terminateProcess(pid);
  scheduler.resumeProcess(pid);

  scheduler.runUntil(nanoseconds(100));
  EXPECT_EQ(runs, 1);
  EXPECT_EQ(scheduler.getProcess(pid)->getState(), ProcessState::Terminated);
}

TEST(ProcessScheduler, LateRegistrationRunsImmediately) {
  ProcessScheduler scheduler;
  bool childRan = false;

  scheduler.registerProcess("parent", [&]() {
    scheduler.registerProcess("child", [&childRan]() { childRan = true; });
  });

  scheduler.runUntil(0);
  EXPECT_TRUE(childRan);
  EXPECT_EQ(scheduler.getNumProcesses(), 2u);
}

TEST(ProcessScheduler, AbortCallbackStopsRun) {
  ProcessScheduler scheduler;
  int runs = 0;

  ProcessId pid = InvalidProcessId;
  pid = scheduler.registerProcess("p", [&]() {
    ++runs;
    scheduler.suspendProcess(
        pid, scheduler.getCurrentTime().advanceTime(nanoseconds(1)));
  });
  scheduler.setShouldAbortCallback([&runs]() { return runs >= 5; });

  scheduler.runUntil(nanoseconds(1000));
  EXPECT_EQ(runs, 5);
  EXPECT_TRUE(scheduler.isAbortRequested());
}

TEST(ProcessScheduler, DeltaCycleLimit) {
  ProcessScheduler::Config config;
  config.maxDeltaCycles = 10;
  ProcessScheduler scheduler(config);

  ProcessId pid = InvalidProcessId;
  pid = scheduler.registerProcess("spin",
                                  [&]() { scheduler.scheduleProcess(pid); });

  // Rescheduling from within the run would loop forever without the limit.
  // The process is still Running while it reschedules itself, so it lands in
  // the next delta.
  scheduler.initialize();
  size_t deltas = scheduler.executeCurrentTime();
  EXPECT_EQ(deltas, 10u);
  EXPECT_EQ(scheduler.getStatistics().maxDeltaCyclesReached, 1u);
}

} // namespace
