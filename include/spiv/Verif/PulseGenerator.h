//===- PulseGenerator.h - External MCE pulse task ---------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the free-running task producing the MCE frame pulse seen
// by the device. It shares no state with the bus components.
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_VERIF_PULSEGENERATOR_H
#define SPIV_VERIF_PULSEGENERATOR_H

#include "spiv/Sim/SimProcess.h"
#include <random>
#include <string>

namespace spiv {
namespace verif {

/// Pulse shape. Times in nanoseconds.
struct PulseTiming {
  uint64_t initialLowNs = 20;
  uint64_t highMinNs = 1900;
  uint64_t highMaxNs = 2100;
  uint64_t lowMinNs = 50;
  uint64_t lowMaxNs = 250;
};

/// Drives `signal` low for the initial delay, then alternates forever
/// between a high phase and a low phase of random length.
class PulseGenerator : public sim::SimProcess {
public:
  PulseGenerator(sim::SignalHost &host, std::mt19937 &rng,
                 llvm::StringRef signal = "mce",
                 const PulseTiming &timing = PulseTiming());

  size_t getPulseCount() const { return pulses; }

protected:
  void resume() override;

private:
  enum class State { Init, High, Low };

  std::mt19937 &rng;
  std::string signal;
  PulseTiming timing;
  State state = State::Init;
  size_t pulses = 0;
};

} // namespace verif
} // namespace spiv

#endif // SPIV_VERIF_PULSEGENERATOR_H
