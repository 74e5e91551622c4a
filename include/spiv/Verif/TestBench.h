//===- TestBench.h - Verification run orchestration -------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the test bench process driving a verification run and
// the entry point assembling a complete run from a configuration.
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_VERIF_TESTBENCH_H
#define SPIV_VERIF_TESTBENCH_H

#include "spiv/Sim/SimProcess.h"
#include "spiv/Sim/SimulationControl.h"
#include "spiv/Support/RunConfig.h"
#include "spiv/Verif/Coverage.h"
#include "spiv/Verif/RegisterModel.h"
#include "spiv/Verif/Scoreboard.h"
#include "spiv/Verif/SpiDriver.h"
#include "spiv/Verif/SpiMonitor.h"
#include "spiv/Verif/StimulusGenerator.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"
#include <optional>
#include <string>

namespace spiv {
namespace verif {

/// Names of the items of the test bench coverage model.
namespace coverage_names {
constexpr const char *kRegName = "top.reg_name";
constexpr const char *kDirection = "top.direction";
constexpr const char *kDataRange = "top.data_range";
constexpr const char *kRegByDirection = "top.reg_x_dir";
constexpr const char *kRegByDataRange = "top.reg_x_data";
} // namespace coverage_names

/// Scoreboard channel carrying bus observations.
constexpr const char *kBusChannel = "bus";

/// Register the coverage model of the test bench: register name, direction
/// and data range points, and their crosses. Write tuples of read-only
/// registers are ignored.
llvm::Error buildCoverageModel(CoverageEngine &engine,
                               const RegisterModel &model,
                               unsigned atLeast = 1);

/// The orchestrator. Each iteration draws a transaction, predicts the
/// observation, transmits the transaction and waits for the driver. The
/// loop ends when `maxRuns` transactions ran or the goal cross is closed.
class TestBench : public sim::SimProcess {
public:
  struct Options {
    uint64_t maxRuns = 2;
    uint64_t minRuns = 2;
    uint8_t chipAddress = 0;
  };

  TestBench(sim::SignalHost &host, sim::SimulationControl &control,
            RegisterModel &model, SpiDriver &driver,
            StimulusGenerator &generator, CoverageEngine &coverage,
            const CoverCross &goal, Scoreboard &scoreboard,
            const Options &options);

  void setResetDetector(const ResetDetector &detector) {
    resetDetector = detector;
  }

  /// Feed an observation of the bus monitor into the scoreboard and sample
  /// the transaction in flight.
  void handleObservation(const Observation &obs);

  /// True once the loop must not issue another transaction.
  bool isGoalReached() const;

  uint64_t getRuns() const { return runs; }
  const CoverCross &getGoal() const { return goal; }
  bool isDone() const { return state == State::Done; }

  /// Print the coverage report, the registers accessed fewer than
  /// `minRuns` times and the scoreboard verdict.
  void printFinalReport(llvm::raw_ostream &os, bool withBins) const;

protected:
  void resume() override;

private:
  enum class State { Next, AwaitDriver, Done };

  /// Issue the next transaction. Returns false when the loop is over.
  bool issueNext();
  void stop();

  sim::SimulationControl &control;
  RegisterModel &model;
  SpiDriver &driver;
  CoverageEngine &coverage;
  const CoverCross &goal;
  Scoreboard &scoreboard;
  Options options;
  TransactionSequence sequence;
  std::optional<ResetDetector> resetDetector;

  State state = State::Next;
  uint64_t runs = 0;
  std::optional<Transaction> inFlight;
};

/// Outcome of a complete run.
struct RunResult {
  bool passed = false;
  uint64_t runs = 0;
  double goalCoverage = 0;
  sim::SimulationStatus status = sim::SimulationStatus::Running;
  /// Why the run failed. Empty on a pass.
  std::string reason;
  uint64_t simTimeFs = 0;
};

/// Assemble and execute a run: scheduler, device, bus components, pulse
/// task, coverage, scoreboard and watchdog. Messages and reports go to `os`.
/// The device is built from `deviceLayout` when given, from `model`
/// otherwise. Fails on an inconsistent configuration.
llvm::Expected<RunResult>
runTestBench(const RunConfig &config, RegisterModel &model,
             llvm::raw_ostream &os,
             const RegisterModel *deviceLayout = nullptr);

} // namespace verif
} // namespace spiv

#endif // SPIV_VERIF_TESTBENCH_H
