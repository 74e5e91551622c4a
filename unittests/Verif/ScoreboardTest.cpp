//===- ScoreboardTest.cpp - Unit tests for the scoreboard -----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Verif/Scoreboard.h"
#include "gtest/gtest.h"
#include <memory>
#include <string>

using namespace spiv;
using namespace spiv::verif;

namespace {

std::string errorText(llvm::Error err) { return llvm::toString(std::move(err)); }

Expectation makeExp(Direction dir, uint8_t address,
                    std::optional<uint16_t> data) {
  Expectation exp;
  exp.direction = dir;
  exp.address = address;
  exp.data = data;
  return exp;
}

Observation makeObs(Direction dir, uint8_t address, uint16_t data) {
  Observation obs;
  obs.direction = dir;
  obs.address = address;
  obs.data = data;
  return obs;
}

//===----------------------------------------------------------------------===//
// Test Fixture
//===----------------------------------------------------------------------===//

class ScoreboardTest : public ::testing::Test {
protected:
  void SetUp() override {
    sim::SimulationControl::Config config;
    config.messageOutput = &llvm::nulls();
    control = std::make_unique<sim::SimulationControl>(config);
  }

  std::unique_ptr<sim::SimulationControl> control;
};

TEST(ScoreboardModeTest, Names) {
  EXPECT_STREQ(getScoreboardModeName(ScoreboardMode::FailImmediately),
               "fail_immediately");
  EXPECT_STREQ(getScoreboardModeName(ScoreboardMode::Accumulate),
               "accumulate");
  EXPECT_EQ(parseScoreboardMode("fail_immediately"),
            ScoreboardMode::FailImmediately);
  EXPECT_EQ(parseScoreboardMode("accumulate"), ScoreboardMode::Accumulate);
  EXPECT_FALSE(parseScoreboardMode("strict").has_value());
}

//===----------------------------------------------------------------------===//
// Channels
//===----------------------------------------------------------------------===//

TEST_F(ScoreboardTest, DuplicateChannel) {
  Scoreboard scoreboard(*control);
  EXPECT_FALSE(static_cast<bool>(scoreboard.addChannel("bus")));
  EXPECT_NE(errorText(scoreboard.addChannel("bus")).find("duplicate"),
            std::string::npos);
  EXPECT_NE(errorText(scoreboard.expect(
                          "other", makeExp(Direction::Read, 0, std::nullopt)))
                .find("unknown scoreboard channel"),
            std::string::npos);
}

TEST_F(ScoreboardTest, MatchesInOrder) {
  Scoreboard scoreboard(*control);
  ASSERT_FALSE(static_cast<bool>(scoreboard.addChannel("bus")));
  ASSERT_FALSE(static_cast<bool>(
      scoreboard.expect("bus", makeExp(Direction::Write, 2, 9))));
  ASSERT_FALSE(static_cast<bool>(
      scoreboard.expect("bus", makeExp(Direction::Read, 2, 9))));
  EXPECT_EQ(scoreboard.getPendingCount("bus"), 2u);

  EXPECT_TRUE(scoreboard.observe("bus", makeObs(Direction::Write, 2, 9)));
  EXPECT_TRUE(scoreboard.observe("bus", makeObs(Direction::Read, 2, 9)));
  EXPECT_EQ(scoreboard.getMatchCount(), 2u);
  EXPECT_EQ(scoreboard.getPendingCount("bus"), 0u);

  scoreboard.finalize();
  EXPECT_FALSE(static_cast<bool>(scoreboard.getResult()));
  EXPECT_EQ(control->getErrorCount(), 0u);
}

TEST_F(ScoreboardTest, WildcardMatchesAnyData) {
  Scoreboard scoreboard(*control);
  ASSERT_FALSE(static_cast<bool>(scoreboard.addChannel("bus")));
  ASSERT_FALSE(static_cast<bool>(
      scoreboard.expect("bus", makeExp(Direction::Read, 5, std::nullopt))));
  EXPECT_TRUE(scoreboard.observe("bus", makeObs(Direction::Read, 5, 0x1234)));

  // Address still has to match.
  ASSERT_FALSE(static_cast<bool>(
      scoreboard.expect("bus", makeExp(Direction::Read, 5, std::nullopt))));
  EXPECT_FALSE(scoreboard.observe("bus", makeObs(Direction::Read, 6, 0)));
}

TEST_F(ScoreboardTest, CustomCompare) {
  Scoreboard scoreboard(*control);
  ASSERT_FALSE(static_cast<bool>(scoreboard.addChannel(
      "low", [](const Expectation &exp, const Observation &obs) {
        return exp.data && (*exp.data & 0xFF) == (obs.data & 0xFF);
      })));
  ASSERT_FALSE(static_cast<bool>(
      scoreboard.expect("low", makeExp(Direction::Read, 0, 0x0012))));
  EXPECT_TRUE(scoreboard.observe("low", makeObs(Direction::Write, 9, 0xAB12)));
}

//===----------------------------------------------------------------------===//
// Mismatches
//===----------------------------------------------------------------------===//

TEST_F(ScoreboardTest, AccumulateKeepsRunning) {
  Scoreboard scoreboard(*control, ScoreboardMode::Accumulate);
  ASSERT_FALSE(static_cast<bool>(scoreboard.addChannel("bus")));
  ASSERT_FALSE(static_cast<bool>(
      scoreboard.expect("bus", makeExp(Direction::Read, 2, 9))));
  ASSERT_FALSE(static_cast<bool>(
      scoreboard.expect("bus", makeExp(Direction::Read, 3, 1))));

  EXPECT_FALSE(scoreboard.observe("bus", makeObs(Direction::Read, 2, 8)));
  EXPECT_TRUE(scoreboard.observe("bus", makeObs(Direction::Read, 3, 1)));

  EXPECT_TRUE(control->shouldContinue());
  EXPECT_EQ(control->getErrorCount(), 1u);
  auto last = control->getLastMessage(sim::MessageSeverity::Error);
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->id, "SCOREBOARD");
  EXPECT_NE(last->text.find("expected"), std::string::npos);

  ASSERT_EQ(scoreboard.getMismatches().size(), 1u);
  const Mismatch &mismatch = scoreboard.getMismatches()[0];
  EXPECT_EQ(mismatch.channel, "bus");
  ASSERT_TRUE(mismatch.expected.has_value());
  ASSERT_TRUE(mismatch.observed.has_value());
  EXPECT_EQ(mismatch.expected->data, std::optional<uint16_t>(9));
  EXPECT_EQ(mismatch.observed->data, 8u);

  scoreboard.finalize();
  std::string text = errorText(scoreboard.getResult());
  EXPECT_EQ(text, "scoreboard: 1 mismatch(es), 1 match(es)");
}

TEST_F(ScoreboardTest, FailImmediatelyIsFatal) {
  Scoreboard scoreboard(*control, ScoreboardMode::FailImmediately);
  ASSERT_FALSE(static_cast<bool>(scoreboard.addChannel("bus")));
  ASSERT_FALSE(static_cast<bool>(
      scoreboard.expect("bus", makeExp(Direction::Write, 2, 9))));

  EXPECT_FALSE(scoreboard.observe("bus", makeObs(Direction::Write, 2, 3)));
  EXPECT_FALSE(control->shouldContinue());
  EXPECT_EQ(control->getStatus(), sim::SimulationStatus::Fatal);
  auto fatal = control->getLastMessage(sim::MessageSeverity::Fatal);
  ASSERT_TRUE(fatal.has_value());
  EXPECT_EQ(fatal->id, "SCOREBOARD");
}

TEST_F(ScoreboardTest, UnexpectedObservations) {
  Scoreboard scoreboard(*control);
  ASSERT_FALSE(static_cast<bool>(scoreboard.addChannel("bus")));

  // Empty queue.
  EXPECT_FALSE(scoreboard.observe("bus", makeObs(Direction::Read, 1, 0)));
  // Unknown channel.
  EXPECT_FALSE(scoreboard.observe("nowhere", makeObs(Direction::Read, 1, 0)));

  ASSERT_EQ(scoreboard.getMismatches().size(), 2u);
  EXPECT_FALSE(scoreboard.getMismatches()[0].expected.has_value());
  EXPECT_EQ(scoreboard.getMismatches()[1].channel, "nowhere");
  auto last = control->getLastMessage(sim::MessageSeverity::Error);
  ASSERT_TRUE(last.has_value());
  EXPECT_NE(last->text.find("unexpected observation"), std::string::npos);
}

TEST_F(ScoreboardTest, FinalizeReportsLeftoversOnce) {
  Scoreboard scoreboard(*control, ScoreboardMode::FailImmediately);
  ASSERT_FALSE(static_cast<bool>(scoreboard.addChannel("bus")));
  ASSERT_FALSE(static_cast<bool>(
      scoreboard.expect("bus", makeExp(Direction::Read, 4, std::nullopt))));

  scoreboard.finalize();
  scoreboard.finalize();
  ASSERT_EQ(scoreboard.getMismatches().size(), 1u);
  EXPECT_FALSE(scoreboard.getMismatches()[0].observed.has_value());
  EXPECT_EQ(scoreboard.getPendingCount("bus"), 0u);
  // Leftovers are errors even in fail_immediately mode.
  EXPECT_EQ(control->getErrorCount(), 1u);
  EXPECT_EQ(control->getFatalCount(), 0u);
  auto last = control->getLastMessage(sim::MessageSeverity::Error);
  ASSERT_TRUE(last.has_value());
  EXPECT_NE(last->text.find("never observed"), std::string::npos);
  EXPECT_NE(errorText(scoreboard.getResult()).find("1 mismatch(es)"),
            std::string::npos);
}

//===----------------------------------------------------------------------===//
// ResetDetector
//===----------------------------------------------------------------------===//

TEST(ResetDetectorTest, ClearsWrittenValues) {
  RegisterModel model;
  RegisterEntry reset;
  reset.name = "SW_RESET_ADDR";
  reset.address = 1;
  reset.bitWidth = 8;
  ASSERT_FALSE(static_cast<bool>(model.addRegister(reset)));
  RegisterEntry clkDiv;
  clkDiv.name = "CLK_DIV_ADDR";
  clkDiv.address = 3;
  clkDiv.bitWidth = 12;
  clkDiv.resetValue = 100;
  ASSERT_FALSE(static_cast<bool>(model.addRegister(clkDiv)));

  ASSERT_FALSE(static_cast<bool>(model.recordWrite("CLK_DIV_ADDR", 7)));
  EXPECT_EQ(model.predictRead("CLK_DIV_ADDR"), std::optional<uint32_t>(7));

  ResetDetector detector(1, 0xA5);
  EXPECT_EQ(detector.getAddress(), 1u);
  EXPECT_EQ(detector.getCode(), 0xA5u);

  Transaction trx;
  trx.registerName = "SW_RESET_ADDR";
  trx.address = 1;
  trx.direction = Direction::Write;
  trx.data = 0x5A;
  EXPECT_FALSE(detector.check(trx, model));
  trx.direction = Direction::Read;
  trx.data = 0xA5;
  EXPECT_FALSE(detector.check(trx, model));
  EXPECT_EQ(model.predictRead("CLK_DIV_ADDR"), std::optional<uint32_t>(7));

  trx.direction = Direction::Write;
  EXPECT_TRUE(detector.isReset(trx));
  EXPECT_TRUE(detector.check(trx, model));
  EXPECT_EQ(detector.getDetectedCount(), 1u);
  EXPECT_EQ(model.predictRead("CLK_DIV_ADDR"), std::optional<uint32_t>(100));
}

} // namespace
