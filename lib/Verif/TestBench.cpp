//===- TestBench.cpp - Verification run orchestration ---------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Verif/TestBench.h"
#include "spiv/Sim/RunWatchdog.h"
#include "spiv/Sim/SignalHost.h"
#include "spiv/Verif/FrameCodec.h"
#include "spiv/Verif/PulseGenerator.h"
#include "spiv/Verif/SpiRegisterDevice.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/JSON.h"
#include <limits>

#define DEBUG_TYPE "spiv-testbench"

using namespace spiv;
using namespace spiv::verif;

//===----------------------------------------------------------------------===//
// Coverage model
//===----------------------------------------------------------------------===//

llvm::Error spiv::verif::buildCoverageModel(CoverageEngine &engine,
                                            const RegisterModel &model,
                                            unsigned atLeast) {
  llvm::StringSet<> readOnly;
  for (const auto &reg : model.getRegisters())
    if (reg.isReadOnly())
      readOnly.insert(reg.name);

  std::vector<std::string> ranges;
  for (DataRange range : getAllDataRanges())
    ranges.push_back(getDataRangeName(range));

  auto regName = CoverPoint::forField(coverage_names::kRegName,
                                      "register_name", model.getNames(),
                                      atLeast);
  auto direction = CoverPoint::forField(coverage_names::kDirection,
                                        "direction", {"Read", "Write"},
                                        atLeast);
  // Only writes carry data.
  auto dataRange = std::make_unique<CoverPoint>(
      coverage_names::kDataRange, ranges,
      [](const Transaction &trx, llvm::StringRef bin) {
        return trx.isWrite() && bin == getDataRangeName(trx.dataRange);
      },
      atLeast);

  const CoverPoint *regByDirDims[] = {regName.get(), direction.get()};
  auto regByDir = std::make_unique<CoverCross>(
      coverage_names::kRegByDirection, regByDirDims,
      [readOnly](CoverCross::BinTuple tuple) {
        return readOnly.count(tuple[0]) && tuple[1] == "Write";
      },
      atLeast);

  const CoverPoint *regByDataDims[] = {regName.get(), dataRange.get()};
  auto regByData = std::make_unique<CoverCross>(
      coverage_names::kRegByDataRange, regByDataDims,
      [readOnly](CoverCross::BinTuple tuple) {
        return readOnly.count(tuple[0]) != 0;
      },
      atLeast);

  if (auto err = engine.addItem(std::move(regName)))
    return err;
  if (auto err = engine.addItem(std::move(direction)))
    return err;
  if (auto err = engine.addItem(std::move(dataRange)))
    return err;
  if (auto err = engine.addItem(std::move(regByDir)))
    return err;
  return engine.addItem(std::move(regByData));
}

//===----------------------------------------------------------------------===//
// TestBench
//===----------------------------------------------------------------------===//

TestBench::TestBench(sim::SignalHost &host, sim::SimulationControl &control,
                     RegisterModel &model, SpiDriver &driver,
                     StimulusGenerator &generator, CoverageEngine &coverage,
                     const CoverCross &goal, Scoreboard &scoreboard,
                     const Options &options)
    : SimProcess(host, "testbench"), control(control), model(model),
      driver(driver), coverage(coverage), goal(goal), scoreboard(scoreboard),
      options(options),
      sequence(
          generator, model, [this]() { return isGoalReached(); },
          [this]() {
            llvm::StringSet<> covered;
            for (const auto &name :
                 this->goal.getCoveredBins(coverage_names::kRegName))
              covered.insert(name);
            return covered;
          }) {}

bool TestBench::isGoalReached() const {
  return runs >= options.maxRuns || goal.getCoverPercentage() >= 100.0;
}

void TestBench::handleObservation(const Observation &obs) {
  scoreboard.observe(kBusChannel, obs);
  if (!inFlight) {
    control.warning("TESTBENCH", "bus activity with no transaction in flight");
    return;
  }
  coverage.sample(*inFlight);
}

bool TestBench::issueNext() {
  if (!control.shouldContinue())
    return false;

  auto next = sequence.next();
  if (!next) {
    control.fatal("STIMULUS", llvm::toString(next.takeError()));
    return false;
  }
  if (!*next) {
    control.info("TESTBENCH",
                 llvm::formatv("Finish tests. {0} transactions were run.",
                               runs)
                     .str());
    control.finish(0);
    return false;
  }

  Transaction trx = std::move(**next);
  if (auto err = validateTransaction(trx, options.chipAddress, model)) {
    control.fatal("TRX_INVALID", llvm::toString(std::move(err)));
    return false;
  }
  model.recordAccess(trx.registerName, trx.direction);

  Expectation exp;
  exp.direction = trx.direction;
  exp.address = trx.address;
  if (trx.isWrite()) {
    if (auto err = model.recordWrite(trx.registerName, trx.data)) {
      control.fatal("TRX_INVALID", llvm::toString(std::move(err)));
      return false;
    }
    if (resetDetector && resetDetector->check(trx, model))
      control.info("RESET", "register file reset; written values cleared");
    exp.data = trx.data;
  } else {
    // Unknown values are checked against a wildcard.
    trx.expectedReadValue = model.predictRead(trx.registerName);
    if (trx.expectedReadValue)
      exp.data = static_cast<uint16_t>(*trx.expectedReadValue);
  }

  std::string text;
  llvm::raw_string_ostream os(text);
  os << trx;
  control.info("TESTBENCH",
               llvm::formatv("Test case # {0}: {1}", runs, os.str()).str(), 2);

  if (auto err = scoreboard.expect(kBusChannel, exp)) {
    control.fatal("SCOREBOARD", llvm::toString(std::move(err)));
    return false;
  }

  inFlight = trx;
  if (auto err = driver.transmit(trx, options.chipAddress, getId())) {
    control.fatal("DRIVER", llvm::toString(std::move(err)));
    return false;
  }
  state = State::AwaitDriver;
  return true;
}

void TestBench::stop() {
  state = State::Done;
  halt();
}

void TestBench::resume() {
  switch (state) {
  case State::Done:
    return;

  case State::AwaitDriver:
    // The driver wakes us once the transaction is complete.
    ++runs;
    inFlight.reset();
    state = State::Next;
    LLVM_FALLTHROUGH;

  case State::Next:
    if (!issueNext())
      stop();
    return;
  }
}

void TestBench::printFinalReport(llvm::raw_ostream &os, bool withBins) const {
  coverage.printReport(os, withBins);

  auto printList = [&](const char *what, Direction dir) {
    std::vector<std::string> names =
        model.getUnderExercised(dir, options.minRuns);
    os << "Registers " << what << " fewer than " << options.minRuns
       << " times: ";
    if (names.empty())
      os << "none\n";
    else
      os << llvm::join(names, ", ") << "\n";
  };
  printList("written", Direction::Write);
  printList("read", Direction::Read);

  os << "Scoreboard: " << scoreboard.getMatchCount() << " match(es), "
     << scoreboard.getMismatches().size() << " mismatch(es)\n";
}

//===----------------------------------------------------------------------===//
// runTestBench
//===----------------------------------------------------------------------===//

namespace {

llvm::json::Array toJSONArray(const std::vector<std::string> &names) {
  llvm::json::Array array;
  for (const auto &name : names)
    array.push_back(name);
  return array;
}

llvm::Error writeJSONReport(llvm::StringRef path, const RunConfig &config,
                            const RunResult &result,
                            const CoverageEngine &coverage,
                            const RegisterModel &model) {
  std::error_code ec;
  llvm::raw_fd_ostream out(path, ec, llvm::sys::fs::OF_Text);
  if (ec)
    return llvm::createStringError(ec, "failed to write coverage report: %s",
                                   path.str().c_str());

  llvm::json::Object notExercised{
      {"write", toJSONArray(model.getUnderExercised(Direction::Write,
                                                    config.minRuns))},
      {"read", toJSONArray(model.getUnderExercised(Direction::Read,
                                                   config.minRuns))},
  };
  llvm::json::Object summary{
      {"passed", result.passed},
      {"status", sim::getSimulationStatusName(result.status)},
      {"reason", result.reason},
      {"seed", static_cast<int64_t>(config.seed)},
      {"runs", static_cast<int64_t>(result.runs)},
      {"goal", config.coverage.goal},
      {"goal_coverage", result.goalCoverage},
      {"sim_time_ns", static_cast<double>(result.simTimeFs) /
                          sim::kFemtosecondsPerNanosecond},
      {"min_runs", static_cast<int64_t>(config.minRuns)},
      {"not_exercised", std::move(notExercised)},
      {"coverage", coverage.toJSON()},
  };
  out << llvm::formatv("{0:2}", llvm::json::Value(std::move(summary))) << "\n";
  return llvm::Error::success();
}

} // namespace

llvm::Expected<RunResult>
spiv::verif::runTestBench(const RunConfig &config, RegisterModel &model,
                          llvm::raw_ostream &os,
                          const RegisterModel *deviceLayout) {
  if (auto err = config.validate())
    return std::move(err);
  if (model.empty())
    return llvm::createStringError(std::errc::invalid_argument,
                                   "register map has no registers");
  std::optional<ScoreboardMode> mode =
      parseScoreboardMode(config.scoreboardMode);
  if (!mode)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "unknown scoreboard mode '%s'",
                                   config.scoreboardMode.c_str());

  std::optional<ResetDetector> resetDetector;
  if (config.reset) {
    const RegisterEntry *reg = model.lookup(config.reset->registerName);
    if (!reg)
      return llvm::createStringError(std::errc::invalid_argument,
                                     "unknown reset register '%s'",
                                     config.reset->registerName.c_str());
    if (reg->isReadOnly() || config.reset->code > reg->getMaxValue())
      return llvm::createStringError(
          std::errc::invalid_argument,
          "reset code 0x%x cannot be written to register '%s'",
          unsigned(config.reset->code), reg->name.c_str());
    resetDetector.emplace(reg->address, config.reset->code);
  }

  // Simulation kernel and run control.
  sim::ProcessScheduler scheduler;
  sim::SchedulerSignalHost host(scheduler);
  sim::SimulationControl::Config controlConfig;
  controlConfig.verbosity = config.verbosity;
  controlConfig.messageOutput = &os;
  sim::SimulationControl control(controlConfig);
  control.setTimeSource([&scheduler]() { return scheduler.getCurrentTime(); });

  // Bus signals at rest: strobe inactive, data lines undriven.
  SpiSignals signals;
  const char *mceSignal = "mce";
  for (const std::string *name :
       {&signals.csN, &signals.sclk, &signals.mosi, &signals.miso})
    host.declareSignal(*name);
  host.declareSignal(mceSignal);
  host.writeBit(signals.csN, true);
  host.writeBit(signals.sclk, false);
  host.writeBit(mceSignal, false);

  std::mt19937 rng(config.seed);
  SpiTiming timing = SpiTiming::forFrequency(config.freqMHz);

  SpiClockGenerator clock(host, signals, timing);
  SpiDriver driver(host, clock, signals, timing, rng);
  SpiMonitor monitor(host, control, signals);
  SpiRegisterDevice device(host, deviceLayout ? *deviceLayout : model,
                           config.chipAddress, signals, mceSignal);
  if (resetDetector)
    device.setResetCommand(resetDetector->getAddress(),
                           resetDetector->getCode());
  PulseGenerator pulse(host, rng, mceSignal);

  // Coverage and checking.
  CoverageEngine coverage;
  coverage.setControl(&control);
  if (auto err = buildCoverageModel(coverage, model, config.coverage.atLeast))
    return std::move(err);
  const CoverCross *goal = coverage.lookupCross(config.coverage.goal);
  if (!goal)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "coverage goal '%s' is not a cross",
                                   config.coverage.goal.c_str());
  for (const auto &entry : config.coverage.status)
    coverage.setStatusReport(entry.first, entry.second);
  for (const auto &entry : config.coverage.weights) {
    CoverItem *item = coverage.lookup(entry.first);
    if (!item)
      return llvm::createStringError(std::errc::invalid_argument,
                                     "coverage weight for unknown item '%s'",
                                     entry.first.c_str());
    item->setWeight(entry.second);
  }

  Scoreboard scoreboard(control, *mode);
  if (auto err = scoreboard.addChannel(kBusChannel))
    return std::move(err);

  StimulusWeights weights;
  weights.coveredWeight = config.coveredWeight;
  weights.uncoveredWeight = config.uncoveredWeight;
  StimulusGenerator generator(rng, weights);

  TestBench::Options options;
  options.maxRuns = config.maxRuns;
  options.minRuns = config.minRuns;
  options.chipAddress = static_cast<uint8_t>(config.chipAddress);
  TestBench bench(host, control, model, driver, generator, coverage, *goal,
                  scoreboard, options);
  if (resetDetector)
    bench.setResetDetector(*resetDetector);
  monitor.setObservationCallback(
      [&bench](const Observation &obs) { bench.handleObservation(obs); });

  sim::RunWatchdog watchdog(
      control, config.simTimeLimitUs * 1000 * sim::kFemtosecondsPerNanosecond,
      std::chrono::milliseconds(config.wallClockLimitS * 1000));
  scheduler.setShouldAbortCallback([&]() {
    watchdog.check(scheduler.getCurrentTime());
    return !control.shouldContinue();
  });

  clock.start();
  driver.start();
  device.start();
  monitor.start();
  if (config.pulseEnabled)
    pulse.start();
  bench.start();

  control.info("TESTBENCH",
               llvm::formatv("seed {0}, {1} registers, goal {2}, at most {3} "
                             "transactions",
                             config.seed, model.size(), config.coverage.goal,
                             config.maxRuns)
                   .str());

  watchdog.arm();
  scheduler.runUntil(std::numeric_limits<uint64_t>::max());
  watchdog.cancel();

  if (control.getStatus() == sim::SimulationStatus::Running)
    control.fatal("SIM_STALL",
                  llvm::formatv("simulation stalled after {0} transactions",
                                bench.getRuns())
                      .str());

  RunResult result;
  result.status = control.getStatus();
  result.runs = bench.getRuns();
  result.goalCoverage = goal->getCoverPercentage();
  result.simTimeFs = scheduler.getCurrentTime().realTime;

  if (result.status == sim::SimulationStatus::Finished)
    scoreboard.finalize();

  std::string verdict;
  if (llvm::Error err = scoreboard.getResult())
    verdict = llvm::toString(std::move(err));

  if (result.status != sim::SimulationStatus::Finished) {
    auto fatal = control.getLastMessage(sim::MessageSeverity::Fatal);
    result.reason = fatal ? fatal->id + ": " + fatal->text
                          : sim::getSimulationStatusName(result.status);
  } else if (!verdict.empty()) {
    result.reason = verdict;
  }
  result.passed = result.reason.empty();

  os << "\n";
  bench.printFinalReport(os, config.coverage.finalBins);
  os << llvm::formatv("Goal {0}: {1:f2}%\n", config.coverage.goal,
                      result.goalCoverage);
  if (result.passed)
    os << "TEST PASSED (" << result.runs << " transactions)\n";
  else
    os << "TEST FAILED: " << result.reason << "\n";

  if (!config.coverage.reportJSON.empty())
    if (auto err = writeJSONReport(config.coverage.reportJSON, config, result,
                                   coverage, model))
      return std::move(err);

  return result;
}
