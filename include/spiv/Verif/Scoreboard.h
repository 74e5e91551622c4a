//===- Scoreboard.h - Expected versus observed transactions -----*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the scoreboard comparing what the bus monitor observed
// against what the test bench expected, and the detector for register file
// reset commands.
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_VERIF_SCOREBOARD_H
#define SPIV_VERIF_SCOREBOARD_H

#include "spiv/Sim/SimulationControl.h"
#include "spiv/Verif/RegisterModel.h"
#include "spiv/Verif/Transaction.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/Support/Error.h"
#include <deque>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace spiv {
namespace verif {

/// What happens on a mismatch.
enum class ScoreboardMode {
  /// Report the first mismatch as fatal; the run stops.
  FailImmediately,
  /// Report every mismatch as an error and fail at the end.
  Accumulate,
};

inline const char *getScoreboardModeName(ScoreboardMode mode) {
  return mode == ScoreboardMode::FailImmediately ? "fail_immediately"
                                                 : "accumulate";
}

std::optional<ScoreboardMode> parseScoreboardMode(llvm::StringRef str);

/// An expected observation. A missing data value matches any data.
struct Expectation {
  Direction direction = Direction::Read;
  uint8_t address = 0;
  std::optional<uint16_t> data;

  bool isWildcard() const { return !data.has_value(); }
};

llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Expectation &exp);

/// A failed comparison. Either side may be missing.
struct Mismatch {
  std::string channel;
  std::optional<Expectation> expected;
  std::optional<Observation> observed;
  sim::SimTime time;
};

class Scoreboard {
public:
  using CompareFn =
      std::function<bool(const Expectation &exp, const Observation &obs)>;

  Scoreboard(sim::SimulationControl &control,
             ScoreboardMode mode = ScoreboardMode::Accumulate);

  /// Direction and address must match, data unless the expectation is a
  /// wildcard.
  static bool defaultCompare(const Expectation &exp, const Observation &obs);

  /// Create a channel. Fails if it already exists.
  llvm::Error addChannel(llvm::StringRef name,
                         CompareFn compare = defaultCompare);

  /// Queue an expectation on a channel.
  llvm::Error expect(llvm::StringRef channel, const Expectation &exp);

  /// Compare an observation against the oldest expectation of the channel.
  /// Returns true on a match.
  bool observe(llvm::StringRef channel, const Observation &obs);

  /// Turn expectations still queued into mismatches.
  void finalize();

  /// The verdict: success, or an error summarising the mismatches.
  llvm::Error getResult() const;

  ScoreboardMode getMode() const { return mode; }
  llvm::ArrayRef<Mismatch> getMismatches() const { return mismatches; }
  size_t getMatchCount() const { return matches; }
  size_t getPendingCount(llvm::StringRef channel) const;

private:
  struct Channel {
    CompareFn compare;
    std::deque<Expectation> queue;
  };

  void reportMismatch(Mismatch mismatch, const llvm::Twine &message);

  sim::SimulationControl &control;
  ScoreboardMode mode;
  llvm::StringMap<Channel> channels;
  std::vector<Mismatch> mismatches;
  size_t matches = 0;
  bool finalized = false;
};

/// Recognises the register file reset command, a write of a given code to a
/// given address, and clears every written value of the model when it goes
/// by.
class ResetDetector {
public:
  ResetDetector(uint8_t address, uint16_t code)
      : address(address), code(code) {}

  bool isReset(const Transaction &trx) const {
    return trx.isWrite() && trx.address == address && trx.data == code;
  }

  /// Returns true if `trx` is the reset command.
  bool check(const Transaction &trx, RegisterModel &model);

  uint8_t getAddress() const { return address; }
  uint16_t getCode() const { return code; }
  size_t getDetectedCount() const { return detected; }

private:
  uint8_t address;
  uint16_t code;
  size_t detected = 0;
};

} // namespace verif
} // namespace spiv

#endif // SPIV_VERIF_SCOREBOARD_H
