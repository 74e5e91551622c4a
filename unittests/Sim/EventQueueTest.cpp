//===----------------------------------------------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Sim/EventQueue.h"
#include "gtest/gtest.h"
#include <string>
#include <vector>

using namespace spiv;
using namespace spiv::sim;

namespace {

//===----------------------------------------------------------------------===//
// SimTime Tests
//===----------------------------------------------------------------------===//

TEST(SimTime, DefaultConstruction) {
  SimTime t;
  EXPECT_EQ(t.realTime, 0u);
  EXPECT_EQ(t.deltaStep, 0u);
}

TEST(SimTime, Comparison) {
  SimTime t1(100, 0);
  SimTime t2(100, 0);
  SimTime t3(200, 0);
  SimTime t4(100, 1);

  EXPECT_TRUE(t1 == t2);
  EXPECT_FALSE(t1 == t3);
  EXPECT_TRUE(t1 < t3);
  EXPECT_FALSE(t3 < t1);

  // Same real time, different delta
  EXPECT_TRUE(t1 < t4);
  EXPECT_TRUE(t4 < t3);
  EXPECT_TRUE(t4 >= t1);
}

TEST(SimTime, NextDeltaAndAdvance) {
  SimTime t(1000, 5);
  SimTime delta = t.nextDelta();
  EXPECT_EQ(delta.realTime, 1000u);
  EXPECT_EQ(delta.deltaStep, 6u);

  SimTime later = t.advanceTime(500);
  EXPECT_EQ(later.realTime, 1500u);
  EXPECT_EQ(later.deltaStep, 0u);
}

TEST(SimTime, Nanoseconds) {
  EXPECT_EQ(nanoseconds(40), 40u * kFemtosecondsPerNanosecond);
  SimTime t(nanoseconds(80));
  EXPECT_DOUBLE_EQ(t.getNanoseconds(), 80.0);
}

TEST(SimTime, Print) {
  std::string text;
  llvm::raw_string_ostream os(text);
  os << SimTime(250) << ", " << SimTime(250, 2);
  os.flush();
  EXPECT_EQ(text, "250fs, 250fs d2");
}

TEST(SchedulingRegion, RegionNames) {
  EXPECT_STREQ(getSchedulingRegionName(SchedulingRegion::Active), "Active");
  EXPECT_STREQ(getSchedulingRegionName(SchedulingRegion::Inactive),
               "Inactive");
  EXPECT_STREQ(getSchedulingRegionName(SchedulingRegion::Postponed),
               "Postponed");
}

//===----------------------------------------------------------------------===//
// EventScheduler Tests
//===----------------------------------------------------------------------===//

TEST(EventScheduler, EmptyQueue) {
  EventScheduler scheduler;
  EXPECT_TRUE(scheduler.isComplete());
  EXPECT_FALSE(scheduler.getNextEventTime().has_value());
  EXPECT_FALSE(scheduler.stepDelta());
  EXPECT_FALSE(scheduler.advanceToNextTime());
}

TEST(EventScheduler, RegionOrderWithinDelta) {
  EventScheduler scheduler;
  std::vector<int> order;

  scheduler.scheduleNow(SchedulingRegion::Postponed,
                        [&order]() { order.push_back(3); });
  scheduler.scheduleNow(SchedulingRegion::Inactive,
                        [&order]() { order.push_back(2); });
  scheduler.scheduleNow(SchedulingRegion::Active,
                        [&order]() { order.push_back(1); });
  EXPECT_EQ(scheduler.getPendingEventCount(), 3u);

  EXPECT_TRUE(scheduler.stepDelta());
  ASSERT_EQ(order.size(), 3u);
  EXPECT_EQ(order[0], 1);
  EXPECT_EQ(order[1], 2);
  EXPECT_EQ(order[2], 3);
  EXPECT_TRUE(scheduler.isComplete());
}

TEST(EventScheduler, EarlierRegionAddedDuringDelta) {
  EventScheduler scheduler;
  std::vector<int> order;

  scheduler.scheduleNow(SchedulingRegion::Inactive, [&]() {
    order.push_back(1);
    scheduler.scheduleNow(SchedulingRegion::Active,
                          [&order]() { order.push_back(2); });
  });
  scheduler.scheduleNow(SchedulingRegion::Postponed,
                        [&order]() { order.push_back(3); });

  scheduler.stepDelta();
  ASSERT_EQ(order.size(), 3u);
  EXPECT_EQ(order[1], 2);
  EXPECT_EQ(order[2], 3);
}

TEST(EventScheduler, NextDeltaBecomesCurrent) {
  EventScheduler scheduler;
  bool ran = false;

  scheduler.scheduleNow(SchedulingRegion::Active, [&]() {
    scheduler.scheduleNextDelta(SchedulingRegion::Active,
                                [&ran]() { ran = true; });
  });

  EXPECT_TRUE(scheduler.stepDelta());
  EXPECT_FALSE(ran);
  EXPECT_EQ(scheduler.getCurrentTime(), SimTime(0, 1));

  EXPECT_TRUE(scheduler.stepDelta());
  EXPECT_TRUE(ran);
}

TEST(EventScheduler, PastEventsAreClamped) {
  EventScheduler scheduler;
  scheduler.scheduleDelay(1000, SchedulingRegion::Active, []() {});
  scheduler.runUntil(1000);
  EXPECT_EQ(scheduler.getCurrentTime().realTime, 1000u);

  bool ran = false;
  scheduler.schedule(SimTime(10), SchedulingRegion::Active,
                     [&ran]() { ran = true; });
  auto next = scheduler.getNextEventTime();
  ASSERT_TRUE(next.has_value());
  EXPECT_EQ(next->realTime, 1000u);

  scheduler.stepDelta();
  EXPECT_TRUE(ran);
}

TEST(EventScheduler, RunUntilStopsAtLimit) {
  EventScheduler scheduler;
  std::vector<uint64_t> times;

  for (uint64_t t : {300u, 100u, 200u, 500u})
    scheduler.schedule(SimTime(t), SchedulingRegion::Active, [&, t]() {
      times.push_back(scheduler.getCurrentTime().realTime);
      EXPECT_EQ(scheduler.getCurrentTime().realTime, t);
    });

  SimTime end = scheduler.runUntil(300);
  EXPECT_EQ(end.realTime, 300u);
  ASSERT_EQ(times.size(), 3u);
  EXPECT_EQ(times[0], 100u);
  EXPECT_EQ(times[1], 200u);
  EXPECT_EQ(times[2], 300u);
  EXPECT_EQ(scheduler.getPendingEventCount(), 1u);
  EXPECT_EQ(scheduler.getStatistics().eventsProcessed, 3u);
  EXPECT_EQ(scheduler.getStatistics().realTimeAdvances, 3u);
}

TEST(EventScheduler, Reset) {
  EventScheduler scheduler;
  scheduler.scheduleDelay(100, SchedulingRegion::Active, []() {});
  scheduler.scheduleDelay(200, SchedulingRegion::Active, []() {});
  scheduler.runUntil(100);

  scheduler.reset();
  EXPECT_TRUE(scheduler.isComplete());
  EXPECT_EQ(scheduler.getCurrentTime(), SimTime());
  EXPECT_EQ(scheduler.getStatistics().eventsProcessed, 0u);
}

} // namespace
