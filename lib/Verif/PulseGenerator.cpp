//===- PulseGenerator.cpp - External MCE pulse task -----------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Verif/PulseGenerator.h"
#include "llvm/Support/Debug.h"

#define DEBUG_TYPE "spiv-pulse"

using namespace spiv;
using namespace spiv::verif;

PulseGenerator::PulseGenerator(sim::SignalHost &host, std::mt19937 &rng,
                               llvm::StringRef signal,
                               const PulseTiming &timing)
    : SimProcess(host, "mce_pulse"), rng(rng), signal(signal.str()),
      timing(timing) {}

void PulseGenerator::resume() {
  switch (state) {
  case State::Init:
    host.writeBit(signal, false);
    state = State::High;
    waitForNs(timing.initialLowNs);
    return;

  case State::High: {
    std::uniform_int_distribution<uint64_t> high(timing.highMinNs,
                                                 timing.highMaxNs);
    host.writeBit(signal, true);
    ++pulses;
    LLVM_DEBUG(llvm::dbgs() << signal << " high at " << host.now() << "\n");
    state = State::Low;
    waitForNs(high(rng));
    return;
  }

  case State::Low: {
    std::uniform_int_distribution<uint64_t> low(timing.lowMinNs,
                                                timing.lowMaxNs);
    host.writeBit(signal, false);
    state = State::High;
    waitForNs(low(rng));
    return;
  }
  }
}
