//===- EventQueue.h - Event queue for the bus simulation kernel -*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the time representation and the event queue driving the
// spiv simulation kernel. Events are move-only callables ordered by real time,
// delta step and scheduling region.
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_SIM_EVENTQUEUE_H
#define SPIV_SIM_EVENTQUEUE_H

#include "llvm/ADT/FunctionExtras.h"
#include "llvm/Support/raw_ostream.h"
#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace spiv {
namespace sim {

/// Femtoseconds per nanosecond. Simulation time is kept in femtoseconds.
constexpr uint64_t kFemtosecondsPerNanosecond = 1000000;

/// Convert nanoseconds to simulation time units.
constexpr uint64_t nanoseconds(uint64_t ns) {
  return ns * kFemtosecondsPerNanosecond;
}

//===----------------------------------------------------------------------===//
// SimTime - Simulation time representation
//===----------------------------------------------------------------------===//

/// A point in simulation time: an absolute time in femtoseconds plus the
/// delta cycle number within that time.
struct SimTime {
  uint64_t realTime;  // Time in femtoseconds
  uint32_t deltaStep; // Delta cycle number

  SimTime() : realTime(0), deltaStep(0) {}
  SimTime(uint64_t time, uint32_t delta = 0)
      : realTime(time), deltaStep(delta) {}

  bool operator==(const SimTime &other) const {
    return realTime == other.realTime && deltaStep == other.deltaStep;
  }
  bool operator!=(const SimTime &other) const { return !(*this == other); }

  bool operator<(const SimTime &other) const {
    if (realTime != other.realTime)
      return realTime < other.realTime;
    return deltaStep < other.deltaStep;
  }
  bool operator<=(const SimTime &other) const { return !(other < *this); }
  bool operator>(const SimTime &other) const { return other < *this; }
  bool operator>=(const SimTime &other) const { return !(*this < other); }

  /// The next delta cycle at the same real time.
  SimTime nextDelta() const { return SimTime(realTime, deltaStep + 1); }

  /// Advance real time, resetting the delta step.
  SimTime advanceTime(uint64_t femtoseconds) const {
    return SimTime(realTime + femtoseconds, 0);
  }

  /// Real time in nanoseconds, for reporting.
  double getNanoseconds() const {
    return static_cast<double>(realTime) / kFemtosecondsPerNanosecond;
  }
};

inline llvm::raw_ostream &operator<<(llvm::raw_ostream &os,
                                     const SimTime &time) {
  os << time.realTime << "fs";
  if (time.deltaStep > 0)
    os << " d" << time.deltaStep;
  return os;
}

//===----------------------------------------------------------------------===//
// SchedulingRegion - Ordering of events within a delta cycle
//===----------------------------------------------------------------------===//

/// Regions within a delta cycle. Events of a region run before any event of
/// a later region in the same delta cycle.
enum class SchedulingRegion : uint8_t {
  /// Process wake-ups and signal updates.
  Active = 0,

  /// Zero-delay follow-ups of the active region.
  Inactive = 1,

  /// Observers that must see the settled values of the delta cycle.
  Postponed = 2,

  /// Number of regions (for array sizing).
  NumRegions = 3
};

/// Get the name of a scheduling region for debugging.
inline const char *getSchedulingRegionName(SchedulingRegion region) {
  switch (region) {
  case SchedulingRegion::Active:
    return "Active";
  case SchedulingRegion::Inactive:
    return "Inactive";
  case SchedulingRegion::Postponed:
    return "Postponed";
  default:
    return "Unknown";
  }
}

//===----------------------------------------------------------------------===//
// Event - Simulation event representation
//===----------------------------------------------------------------------===//

/// An event is a move-only callable executed once at its scheduled time.
using Event = llvm::unique_function<void()>;

//===----------------------------------------------------------------------===//
// EventScheduler - Time ordered event queue
//===----------------------------------------------------------------------===//

/// Time-ordered queue of events. Events scheduled for the same time and delta
/// step are grouped in a slot and executed region by region.
class EventScheduler {
public:
  EventScheduler();
  ~EventScheduler();

  EventScheduler(const EventScheduler &) = delete;
  EventScheduler &operator=(const EventScheduler &) = delete;

  /// Schedule an event at the specified time and region. Times in the past
  /// are clamped to the current time.
  void schedule(const SimTime &time, SchedulingRegion region, Event event);

  /// Schedule an event at the current time in the specified region.
  void scheduleNow(SchedulingRegion region, Event event);

  /// Schedule an event for the next delta cycle.
  void scheduleNextDelta(SchedulingRegion region, Event event);

  /// Schedule an event at a future real time.
  void scheduleDelay(uint64_t delayFemtoseconds, SchedulingRegion region,
                     Event event);

  /// Get the current simulation time.
  const SimTime &getCurrentTime() const { return currentTime; }

  /// Time of the earliest pending event, if any.
  std::optional<SimTime> getNextEventTime() const;

  /// Execute all events of the current time and delta step, region by
  /// region. Returns false if there was nothing to execute.
  bool stepDelta();

  /// Move the current time to the earliest pending event without executing
  /// it. Returns false if no events are pending.
  bool advanceToNextTime();

  /// Run events until none are left or the time limit is passed.
  SimTime runUntil(uint64_t maxTimeFemtoseconds);

  /// Check if the queue is empty.
  bool isComplete() const { return pendingEvents == 0; }

  /// Number of events not executed yet.
  size_t getPendingEventCount() const { return pendingEvents; }

  struct Statistics {
    size_t eventsProcessed = 0;
    size_t deltaCycles = 0;
    size_t realTimeAdvances = 0;
  };

  const Statistics &getStatistics() const { return stats; }

  /// Drop all events and rewind to time zero.
  void reset();

private:
  using SlotKey = std::pair<uint64_t, uint32_t>;

  /// Events of one (time, delta) pair, one queue per region.
  struct DeltaSlot {
    std::vector<Event>
        regionQueues[static_cast<size_t>(SchedulingRegion::NumRegions)];

    bool empty() const {
      for (const auto &queue : regionQueues)
        if (!queue.empty())
          return false;
      return true;
    }
  };

  std::map<SlotKey, DeltaSlot> slots;
  SimTime currentTime;
  size_t pendingEvents = 0;
  Statistics stats;
};

} // namespace sim
} // namespace spiv

#endif // SPIV_SIM_EVENTQUEUE_H
