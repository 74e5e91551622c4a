//===- spiv-run.cpp - Register bus verification run driver ----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements the 'spiv-run' tool. It loads a run configuration and
// a register map, runs the constrained-random test bench against the
// behavioural register device until the coverage goal is met, and reports
// the verdict through its exit code.
//
// Usage:
//   spiv-run cfg/spiv-run.yaml
//   spiv-run --regs=cfg/regs.json --seed=42 --max-runs=500
//   spiv-run cfg/spiv-run.yaml --scoreboard=fail_immediately -debug-only=spiv-driver
//
//===----------------------------------------------------------------------===//

#include "spiv/Support/RunConfig.h"
#include "spiv/Verif/RegisterModel.h"
#include "spiv/Verif/TestBench.h"
#include "llvm/Support/CommandLine.h"
#include "llvm/Support/InitLLVM.h"
#include "llvm/Support/WithColor.h"
#include "llvm/Support/raw_ostream.h"

namespace cl = llvm::cl;
using namespace spiv;
using llvm::WithColor;

//===----------------------------------------------------------------------===//
// Command-line Options
//===----------------------------------------------------------------------===//

static cl::OptionCategory mainCategory("spiv-run Options");

static cl::opt<std::string> configFile(cl::Positional,
                                       cl::desc("[run config YAML]"),
                                       cl::init(""), cl::cat(mainCategory));

static cl::opt<std::string>
    regsFile("regs", cl::desc("Register map (JSON), overrides register_map"),
             cl::value_desc("filename"), cl::cat(mainCategory));

static cl::opt<unsigned> seed("seed", cl::desc("Random seed"),
                              cl::cat(mainCategory));

static cl::opt<unsigned long long>
    maxRuns("max-runs", cl::desc("Maximum number of transactions"),
            cl::cat(mainCategory));

static cl::opt<std::string>
    scoreboardMode("scoreboard",
                   cl::desc("Scoreboard mode (accumulate, fail_immediately)"),
                   cl::value_desc("mode"), cl::cat(mainCategory));

static cl::opt<std::string>
    reportJSON("report-json", cl::desc("Write the coverage summary as JSON"),
               cl::value_desc("filename"), cl::cat(mainCategory));

static cl::opt<bool> noPulse("no-pulse", cl::desc("Do not drive the MCE pulse"),
                             cl::init(false), cl::cat(mainCategory));

static cl::opt<unsigned long long>
    timeout("timeout", cl::desc("Wall-clock limit in seconds (0 = none)"),
            cl::cat(mainCategory));

static cl::opt<int> verbosity("verbosity",
                              cl::desc("Verbosity of informational messages"),
                              cl::cat(mainCategory));

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

/// Apply the options given on the command line on top of the config file.
static void applyOverrides(RunConfig &config) {
  if (!regsFile.empty())
    config.registerMap = regsFile;
  if (seed.getNumOccurrences())
    config.seed = seed;
  if (maxRuns.getNumOccurrences())
    config.maxRuns = maxRuns;
  if (!scoreboardMode.empty())
    config.scoreboardMode = scoreboardMode;
  if (!reportJSON.empty())
    config.coverage.reportJSON = reportJSON;
  if (noPulse)
    config.pulseEnabled = false;
  if (timeout.getNumOccurrences())
    config.wallClockLimitS = timeout;
  if (verbosity.getNumOccurrences())
    config.verbosity = verbosity;
}

static int execute() {
  llvm::Expected<RunConfig> config =
      configFile.empty() ? RunConfig::loadFromYAML("")
                         : RunConfig::loadFromFile(configFile);
  if (!config) {
    WithColor::error() << llvm::toString(config.takeError()) << "\n";
    return 1;
  }
  applyOverrides(*config);
  if (auto err = config->validate()) {
    WithColor::error() << llvm::toString(std::move(err)) << "\n";
    return 1;
  }
  if (config->registerMap.empty()) {
    WithColor::error() << "no register map; pass --regs or set register_map\n";
    return 1;
  }

  verif::RegisterMapOptions mapOptions;
  mapOptions.chipAddress = static_cast<uint8_t>(config->chipAddress);
  mapOptions.chipId = static_cast<uint8_t>(config->chipId);
  mapOptions.chipIdRegister = config->chipIdRegister;
  auto model = verif::RegisterModel::loadFromFile(config->registerMap,
                                                  mapOptions);
  if (!model) {
    WithColor::error() << llvm::toString(model.takeError()) << "\n";
    return 1;
  }

  auto result = verif::runTestBench(*config, *model, llvm::outs());
  if (!result) {
    WithColor::error() << llvm::toString(result.takeError()) << "\n";
    return 1;
  }
  return result->passed ? 0 : 1;
}

int main(int argc, char **argv) {
  llvm::InitLLVM y(argc, argv);

  cl::HideUnrelatedOptions(mainCategory);
  cl::ParseCommandLineOptions(argc, argv,
                              "spiv register bus verification run\n");
  return execute();
}
