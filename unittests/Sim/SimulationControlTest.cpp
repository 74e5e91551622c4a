//===- SimulationControlTest.cpp - Tests for SimulationControl ------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Sim/SimulationControl.h"
#include "gtest/gtest.h"
#include <memory>
#include <string>

using namespace spiv::sim;

//===----------------------------------------------------------------------===//
// Test Fixtures
//===----------------------------------------------------------------------===//

class SimulationControlTest : public ::testing::Test {
protected:
  void SetUp() override {
    SimulationControl::Config config;
    config.messageOutput = &llvm::nulls(); // Suppress output for tests
    control = std::make_unique<SimulationControl>(config);
  }

  void TearDown() override { control.reset(); }

  std::unique_ptr<SimulationControl> control;
};

//===----------------------------------------------------------------------===//
// Status Tests
//===----------------------------------------------------------------------===//

TEST_F(SimulationControlTest, InitialStatus) {
  EXPECT_EQ(control->getStatus(), SimulationStatus::Running);
  EXPECT_TRUE(control->shouldContinue());
}

TEST_F(SimulationControlTest, StatusNames) {
  EXPECT_STREQ(getSimulationStatusName(SimulationStatus::Running), "running");
  EXPECT_STREQ(getSimulationStatusName(SimulationStatus::Finished), "finished");
  EXPECT_STREQ(getSimulationStatusName(SimulationStatus::Timeout), "timeout");
  EXPECT_STREQ(getSimulationStatusName(SimulationStatus::Fatal), "fatal");
  EXPECT_STREQ(getSimulationStatusName(SimulationStatus::Aborted), "aborted");
}

//===----------------------------------------------------------------------===//
// Finish Tests
//===----------------------------------------------------------------------===//

TEST_F(SimulationControlTest, Finish) {
  control->finish(0);

  EXPECT_EQ(control->getStatus(), SimulationStatus::Finished);
  EXPECT_FALSE(control->shouldContinue());
  EXPECT_EQ(control->getExitCode(), 0);
}

TEST_F(SimulationControlTest, FirstEndWins) {
  control->fatal("DRIVER", "bus stuck");
  control->finish(0);
  control->abort();

  EXPECT_EQ(control->getStatus(), SimulationStatus::Fatal);
  EXPECT_EQ(control->getExitCode(), 1);
}

TEST_F(SimulationControlTest, FinishCallback) {
  SimulationStatus seen = SimulationStatus::Running;
  int calls = 0;
  control->setFinishCallback([&](SimulationStatus status) {
    seen = status;
    ++calls;
  });

  control->abort();
  control->finish();
  EXPECT_EQ(seen, SimulationStatus::Aborted);
  EXPECT_EQ(calls, 1);
}

TEST_F(SimulationControlTest, TimeoutStatus) {
  control->timeout("too slow");

  EXPECT_EQ(control->getStatus(), SimulationStatus::Timeout);
  EXPECT_EQ(control->getFatalCount(), 1u);
  auto last = control->getLastMessage(MessageSeverity::Fatal);
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->id, "WATCHDOG");
  EXPECT_EQ(last->text, "too slow");
}

//===----------------------------------------------------------------------===//
// Message Tests
//===----------------------------------------------------------------------===//

TEST_F(SimulationControlTest, MessageCounts) {
  control->info("A", "one");
  control->warning("B", "two");
  control->error("C", "three");
  control->error("C", "four");

  EXPECT_EQ(control->getInfoCount(), 1u);
  EXPECT_EQ(control->getWarningCount(), 1u);
  EXPECT_EQ(control->getErrorCount(), 2u);
  EXPECT_EQ(control->getFatalCount(), 0u);
  EXPECT_TRUE(control->shouldContinue());
  EXPECT_EQ(control->getMessageHistory().size(), 4u);
}

TEST_F(SimulationControlTest, VerbosityFiltersInfo) {
  control->setVerbosity(1);
  control->info("TRACE", "hidden", 2);
  control->info("TRACE", "shown", 1);

  EXPECT_EQ(control->getInfoCount(), 2u);
  ASSERT_EQ(control->getMessageHistory().size(), 1u);
  EXPECT_EQ(control->getMessageHistory()[0].text, "shown");
}

TEST_F(SimulationControlTest, HistoryIsBounded) {
  SimulationControl::Config config;
  config.messageOutput = &llvm::nulls();
  config.maxHistorySize = 2;
  SimulationControl bounded(config);

  bounded.warning("W", "a");
  bounded.warning("W", "b");
  bounded.warning("W", "c");

  ASSERT_EQ(bounded.getMessageHistory().size(), 2u);
  EXPECT_EQ(bounded.getMessageHistory()[0].text, "b");
  EXPECT_EQ(bounded.getWarningCount(), 3u);
}

TEST_F(SimulationControlTest, MessageFormat) {
  std::string text;
  llvm::raw_string_ostream os(text);
  control->setOutputStream(os);
  control->setTimeSource([]() { return SimTime(nanoseconds(1250)); });

  control->error("SCOREBOARD", "data mismatch");
  control->setShowTime(false);
  control->info("RESET", "cleared");
  os.flush();

  EXPECT_EQ(text, "[1250.0ns] ERROR(SCOREBOARD): data mismatch\n"
                  "INFO(RESET): cleared\n");
  EXPECT_EQ(control->getMessageHistory()[0].time.realTime, nanoseconds(1250));
}

TEST_F(SimulationControlTest, LastMessageBySeverity) {
  EXPECT_FALSE(control->getLastMessage(MessageSeverity::Error).has_value());
  control->error("X", "first");
  control->warning("Y", "between");
  control->error("X", "second");

  auto last = control->getLastMessage(MessageSeverity::Error);
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->text, "second");
}
