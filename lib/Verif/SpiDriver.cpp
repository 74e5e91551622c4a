//===- SpiDriver.cpp - Serial bus clock generator and driver --------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements the master side of the register bus.
//
//===----------------------------------------------------------------------===//

#include "spiv/Verif/SpiDriver.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/Format.h"
#include <cmath>

#define DEBUG_TYPE "spiv-driver"

using namespace spiv;
using namespace spiv::verif;
using sim::EdgeType;

SpiTiming SpiTiming::forFrequency(double mhz) {
  SpiTiming timing;
  // 1 / (2 * f) with f in MHz, expressed in femtoseconds.
  timing.halfPeriod = static_cast<uint64_t>(std::llround(5.0e8 / mhz));
  return timing;
}

//===----------------------------------------------------------------------===//
// SpiClockGenerator
//===----------------------------------------------------------------------===//

SpiClockGenerator::SpiClockGenerator(sim::SignalHost &host,
                                     const SpiSignals &signals,
                                     const SpiTiming &timing)
    : SimProcess(host, "spi_clock"), signals(signals), timing(timing) {}

bool SpiClockGenerator::strobe(unsigned clocks) {
  if (isBusy() || clocks == 0)
    return false;
  remaining = clocks;
  state = State::ClockLow;
  host.wake(getId());
  return true;
}

void SpiClockGenerator::resume() {
  switch (state) {
  case State::Idle:
    return;

  case State::ClockLow:
    // Chip select stays low for the whole strobe.
    host.writeBit(signals.csN, false);
    host.writeBit(signals.sclk, false);
    state = State::ClockHigh;
    waitFor(timing.halfPeriod);
    return;

  case State::ClockHigh:
    host.writeBit(signals.sclk, true);
    --remaining;
    state = remaining ? State::ClockLow : State::Hold;
    waitFor(timing.halfPeriod);
    return;

  case State::Hold:
    host.writeBit(signals.sclk, false);
    state = State::Release;
    waitFor(timing.strobeHold);
    return;

  case State::Release:
    host.writeBit(signals.csN, true);
    ++strobes;
    state = State::Idle;
    return;
  }
}

//===----------------------------------------------------------------------===//
// SpiDriver
//===----------------------------------------------------------------------===//

SpiDriver::SpiDriver(sim::SignalHost &host, SpiClockGenerator &clock,
                     const SpiSignals &signals, const SpiTiming &timing,
                     std::mt19937 &rng)
    : SimProcess(host, "spi_driver"), clock(clock), signals(signals),
      timing(timing), rng(rng) {}

llvm::Error SpiDriver::transmit(const Transaction &trx, uint8_t chipAddress,
                                sim::ProcessId requester) {
  LLVM_DEBUG(llvm::dbgs() << "transmit " << trx << "\n");
  return transmitFrame(makeRequest(trx, chipAddress), requester);
}

llvm::Error SpiDriver::transmitFrame(const RequestFrame &frame,
                                     sim::ProcessId requester) {
  if (isBusy() || clock.isBusy())
    return llvm::createStringError(std::errc::device_or_resource_busy,
                                   "bus driver is busy");
  frameBits = encodeRequest(frame);
  isRead = !frame.write;
  this->requester = requester;
  state = State::Start;
  host.wake(getId());
  return llvm::Error::success();
}

void SpiDriver::complete() {
  state = State::Idle;
  if (requester != sim::InvalidProcessId)
    host.wake(requester);
}

void SpiDriver::resume() {
  switch (state) {
  case State::Idle:
    return;

  case State::Start:
    LLVM_DEBUG(llvm::dbgs() << "frame " << llvm::format_hex(frameBits, 10)
                            << " at " << host.now() << "\n");
    clock.strobe(kFrameBits);
    bitIndex = kFrameBits - 1;
    state = State::DriveBits;
    waitEdge(signals.sclk, EdgeType::Posedge);
    return;

  case State::DriveBits: {
    bool bit = (frameBits >> bitIndex) & 1;
    host.writeBit(signals.mosi, bit);
    LLVM_DEBUG(llvm::dbgs() << "  bit " << bitIndex << " ("
                            << getRequestFieldName(bitIndex) << ") = " << bit
                            << "\n");
    if (--bitIndex < 0) {
      state = State::AwaitStop;
      waitEdge(signals.csN, EdgeType::Posedge);
    } else {
      waitEdge(signals.sclk, EdgeType::Posedge);
    }
    return;
  }

  case State::AwaitStop:
    host.release(signals.mosi);
    ++framesSent;
    state = State::Pause;
    waitFor(timing.interFramePause);
    return;

  case State::Pause:
    if (!isRead) {
      complete();
      return;
    }
    // A read needs a second strobe to clock out the response.
    clock.strobe(kFrameBits);
    state = State::AwaitResponseStop;
    waitEdge(signals.csN, EdgeType::Posedge);
    return;

  case State::AwaitResponseStop: {
    std::uniform_int_distribution<uint64_t> pause(timing.responsePauseMinNs,
                                                  timing.responsePauseMaxNs);
    state = State::ResponsePause;
    waitForNs(pause(rng));
    return;
  }

  case State::ResponsePause:
    complete();
    return;
  }
}
