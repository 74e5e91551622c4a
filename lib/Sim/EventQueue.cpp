//===- EventQueue.cpp - Event queue for the bus simulation kernel ---------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements the time-ordered event queue of the spiv simulation
// kernel.
//
//===----------------------------------------------------------------------===//

#include "spiv/Sim/EventQueue.h"
#include "llvm/Support/Debug.h"

#define DEBUG_TYPE "spiv-event-queue"

using namespace spiv;
using namespace spiv::sim;

EventScheduler::EventScheduler() = default;

EventScheduler::~EventScheduler() = default;

void EventScheduler::schedule(const SimTime &time, SchedulingRegion region,
                              Event event) {
  SimTime when = time < currentTime ? currentTime : time;
  if (when != time)
    LLVM_DEBUG(llvm::dbgs() << "Clamped event at " << time << " to "
                            << currentTime << "\n");

  auto &slot = slots[SlotKey(when.realTime, when.deltaStep)];
  slot.regionQueues[static_cast<size_t>(region)].push_back(std::move(event));
  ++pendingEvents;
}

void EventScheduler::scheduleNow(SchedulingRegion region, Event event) {
  schedule(currentTime, region, std::move(event));
}

void EventScheduler::scheduleNextDelta(SchedulingRegion region, Event event) {
  schedule(currentTime.nextDelta(), region, std::move(event));
}

void EventScheduler::scheduleDelay(uint64_t delayFemtoseconds,
                                   SchedulingRegion region, Event event) {
  schedule(currentTime.advanceTime(delayFemtoseconds), region,
           std::move(event));
}

std::optional<SimTime> EventScheduler::getNextEventTime() const {
  if (slots.empty())
    return std::nullopt;
  const SlotKey &key = slots.begin()->first;
  return SimTime(key.first, key.second);
}

bool EventScheduler::stepDelta() {
  auto it = slots.find(SlotKey(currentTime.realTime, currentTime.deltaStep));
  if (it == slots.end())
    return false;

  // References into a std::map stay valid while events insert new slots, so
  // the slot can be drained in place. Events may add to an earlier region of
  // the same slot, hence the restart from the first region.
  DeltaSlot &slot = it->second;
  size_t processed = 0;
  bool again = true;
  while (again) {
    again = false;
    for (auto &queue : slot.regionQueues) {
      if (queue.empty())
        continue;
      std::vector<Event> batch;
      std::swap(batch, queue);
      pendingEvents -= batch.size();
      for (auto &event : batch) {
        event();
        ++processed;
      }
      again = true;
      break;
    }
  }
  slots.erase(it);

  stats.eventsProcessed += processed;
  ++stats.deltaCycles;

  // Follow-up deltas at the same real time become current right away.
  if (!slots.empty()) {
    const SlotKey &next = slots.begin()->first;
    if (next.first == currentTime.realTime)
      currentTime = SimTime(next.first, next.second);
  }
  return processed > 0;
}

bool EventScheduler::advanceToNextTime() {
  auto next = getNextEventTime();
  if (!next)
    return false;
  if (*next == currentTime)
    return true;
  if (next->realTime > currentTime.realTime)
    ++stats.realTimeAdvances;
  currentTime = *next;
  LLVM_DEBUG(llvm::dbgs() << "Advanced time to " << currentTime << "\n");
  return true;
}

SimTime EventScheduler::runUntil(uint64_t maxTimeFemtoseconds) {
  while (!isComplete()) {
    auto next = getNextEventTime();
    if (!next || next->realTime > maxTimeFemtoseconds)
      break;
    advanceToNextTime();
    stepDelta();
  }
  return currentTime;
}

void EventScheduler::reset() {
  slots.clear();
  currentTime = SimTime();
  pendingEvents = 0;
  stats = Statistics();
}
