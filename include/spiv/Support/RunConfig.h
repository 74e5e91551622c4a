//===- RunConfig.h - Verification run configuration -------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file declares the configuration of a verification run, loaded from
// YAML. Every key is optional.
//
// Example configuration:
//
// ```yaml
// seed: 1638188048
// max_runs: 200
// min_runs: 2
// chip_addr: 0
// chip_id: 3
// freq_mhz: 12.5
// register_map: regs.json
// scoreboard: accumulate
// reset: {register: SW_RESET_ADDR, code: 0xA5}
// stimulus: {covered_weight: 1, uncovered_weight: 8}
// pulse: {enabled: true}
// coverage:
//   at_least: 1
//   goal: top.reg_x_dir
//   final_bins: true
//   report_json: coverage.json
//   status:
//     top.reg_x_dir: [cover_percentage, "covered_bins:top.reg_name"]
//   weights: {top.reg_x_dir: 2}
// timeouts: {sim_time_us: 0, wall_clock_s: 3600}
// verbosity: 1
// ```
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_SUPPORT_RUNCONFIG_H
#define SPIV_SUPPORT_RUNCONFIG_H

#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/raw_ostream.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace spiv {

/// The register file reset command.
struct ResetCommandConfig {
  std::string registerName;
  uint16_t code = 0;
};

/// Coverage collection settings.
struct CoverageConfig {
  unsigned atLeast = 1;
  /// Cross whose closure ends the run.
  std::string goal = "top.reg_x_dir";
  /// Print per-bin hit counts in the final report.
  bool finalBins = true;
  /// Write the coverage summary here when not empty.
  std::string reportJSON;
  /// Fields reported after every sample, per coverage item.
  std::vector<std::pair<std::string, std::vector<std::string>>> status;
  /// Weight of an item in the total coverage. Unlisted items weigh 1.
  std::vector<std::pair<std::string, unsigned>> weights;
};

/// Settings of one verification run.
struct RunConfig {
  uint32_t seed = 1;
  uint64_t maxRuns = 2;
  /// Registers accessed fewer times are listed as not exercised.
  uint64_t minRuns = 2;

  unsigned chipAddress = 0;
  unsigned chipId = 3;
  std::string chipIdRegister = "CHIP_ID_ADDR";

  /// Serial clock frequency.
  double freqMHz = 12.5;

  /// Path of the JSON register map.
  std::string registerMap;

  /// "accumulate" or "fail_immediately".
  std::string scoreboardMode = "accumulate";

  std::optional<ResetCommandConfig> reset;

  unsigned coveredWeight = 1;
  unsigned uncoveredWeight = 8;

  bool pulseEnabled = true;

  CoverageConfig coverage;

  /// Zero disables the bound.
  uint64_t simTimeLimitUs = 0;
  uint64_t wallClockLimitS = 3600;

  int verbosity = 1;

  /// Parse a configuration from YAML text. Empty text gives the defaults.
  static llvm::Expected<RunConfig> loadFromYAML(llvm::StringRef yamlContent);

  /// Load a configuration file. A relative register map path is resolved
  /// against the directory of the file.
  static llvm::Expected<RunConfig> loadFromFile(llvm::StringRef filePath);

  /// Check value ranges.
  llvm::Error validate() const;

  /// Print the configuration as YAML.
  void print(llvm::raw_ostream &os) const;
};

} // namespace spiv

#endif // SPIV_SUPPORT_RUNCONFIG_H
