//===- SpiDriver.h - Serial bus clock generator and driver ------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the master side of the register bus: the strobe
// generator producing chip select and serial clock, and the driver shifting
// request frames out on the rising clock edges.
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_VERIF_SPIDRIVER_H
#define SPIV_VERIF_SPIDRIVER_H

#include "spiv/Sim/SimProcess.h"
#include "spiv/Verif/FrameCodec.h"
#include "spiv/Verif/Transaction.h"
#include "llvm/Support/Error.h"
#include <random>
#include <string>

namespace spiv {
namespace verif {

/// Names of the bus signals.
struct SpiSignals {
  std::string csN = "cs_n";
  std::string sclk = "sclk";
  std::string mosi = "mosi";
  std::string miso = "miso";
};

/// Bus timing. All times in femtoseconds.
struct SpiTiming {
  /// Half period of the serial clock.
  uint64_t halfPeriod = sim::nanoseconds(40);
  /// Time between the last falling clock edge and the rising chip select.
  uint64_t strobeHold = sim::nanoseconds(20);
  /// Pause after every request frame.
  uint64_t interFramePause = sim::nanoseconds(200);
  /// Bounds of the random pause after a response frame, in nanoseconds.
  uint64_t responsePauseMinNs = 10;
  uint64_t responsePauseMaxNs = 200;

  /// Timing for a serial clock of `mhz` MHz.
  static SpiTiming forFrequency(double mhz);
};

//===----------------------------------------------------------------------===//
// SpiClockGenerator
//===----------------------------------------------------------------------===//

/// Produces one strobe: chip select low, a number of clock pulses, clock
/// low, strobe hold, chip select high.
class SpiClockGenerator : public sim::SimProcess {
public:
  SpiClockGenerator(sim::SignalHost &host, const SpiSignals &signals,
                    const SpiTiming &timing);

  /// Start a strobe of `clocks` pulses. Ignored while a strobe is running.
  bool strobe(unsigned clocks = kFrameBits);

  bool isBusy() const { return state != State::Idle; }
  size_t getStrobeCount() const { return strobes; }

protected:
  void resume() override;

private:
  enum class State { Idle, ClockLow, ClockHigh, Hold, Release };

  const SpiSignals &signals;
  const SpiTiming &timing;
  State state = State::Idle;
  unsigned remaining = 0;
  size_t strobes = 0;
};

//===----------------------------------------------------------------------===//
// SpiDriver
//===----------------------------------------------------------------------===//

/// Drives request frames on the data output, MSB first, one bit per rising
/// clock edge. A read is followed by a data-less strobe clocking out the
/// response. The requester is woken once the transaction is complete.
class SpiDriver : public sim::SimProcess {
public:
  SpiDriver(sim::SignalHost &host, SpiClockGenerator &clock,
            const SpiSignals &signals, const SpiTiming &timing,
            std::mt19937 &rng);

  /// Start transmitting a transaction to `chipAddress`. Fails while another
  /// transaction is in flight.
  llvm::Error transmit(const Transaction &trx, uint8_t chipAddress,
                       sim::ProcessId requester);

  /// Start transmitting a prepared request frame.
  llvm::Error transmitFrame(const RequestFrame &frame,
                            sim::ProcessId requester);

  bool isBusy() const { return state != State::Idle; }
  size_t getFramesSent() const { return framesSent; }

protected:
  void resume() override;

private:
  enum class State {
    Idle,
    Start,
    DriveBits,
    AwaitStop,
    Pause,
    AwaitResponseStop,
    ResponsePause
  };

  void complete();

  SpiClockGenerator &clock;
  const SpiSignals &signals;
  const SpiTiming &timing;
  std::mt19937 &rng;

  State state = State::Idle;
  uint32_t frameBits = 0;
  bool isRead = false;
  int bitIndex = 0;
  sim::ProcessId requester = sim::InvalidProcessId;
  size_t framesSent = 0;
};

} // namespace verif
} // namespace spiv

#endif // SPIV_VERIF_SPIDRIVER_H
