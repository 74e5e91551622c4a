//===- SpiMonitor.cpp - Serial bus monitor --------------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Verif/SpiMonitor.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/FormatVariadic.h"

#define DEBUG_TYPE "spiv-monitor"

using namespace spiv;
using namespace spiv::verif;
using sim::EdgeType;

SpiMonitor::SpiMonitor(sim::SignalHost &host, sim::SimulationControl &control,
                       const SpiSignals &signals)
    : SimProcess(host, "spi_monitor"), control(control), signals(signals) {}

void SpiMonitor::protocolError(llvm::StringRef id,
                               const llvm::Twine &message) {
  control.fatal(id, message.str());
  state = State::Stopped;
  halt();
}

bool SpiMonitor::sampleBit(llvm::StringRef signal, const char *field) {
  sim::SignalValue value = host.readSignal(signal);
  if (value.isUnknown()) {
    protocolError("SPI_MON_UNDEF",
                  llvm::formatv("undefined value on {0} at bit {1} ({2})",
                                signal, bitIndex, field));
    return false;
  }
  LLVM_DEBUG(llvm::dbgs() << "  sampled " << signal << " bit " << bitIndex
                          << " (" << field << ") = " << value.getLSB()
                          << "\n");
  shiftReg |= static_cast<uint32_t>(value.getLSB()) << bitIndex;
  return true;
}

void SpiMonitor::emit(const Observation &obs) {
  ++observations;
  LLVM_DEBUG(llvm::dbgs() << "observed " << obs << " at " << host.now()
                          << "\n");
  if (onObservation)
    onObservation(obs);
}

void SpiMonitor::finishRequest() {
  auto frame = decodeRequest(shiftReg);
  if (!frame) {
    protocolError("SPI_MON_FRAME", llvm::toString(frame.takeError()));
    return;
  }
  request = *frame;

  if (!request.write) {
    // The response arrives with the next strobe.
    state = State::AwaitingResponse;
    waitEdge(signals.csN, EdgeType::Negedge);
    return;
  }

  Observation obs;
  obs.direction = Direction::Write;
  obs.address = request.address;
  obs.data = request.data;
  state = State::Idle;
  waitEdge(signals.csN, EdgeType::Negedge);
  emit(obs);
}

void SpiMonitor::finishResponse() {
  auto frame = decodeResponse(shiftReg);
  if (!frame) {
    protocolError("SPI_MON_FRAME", llvm::toString(frame.takeError()));
    return;
  }
  if (frame->chipAddress != request.chipAddress) {
    protocolError("SPI_MON_CHIP",
                  llvm::formatv("response chip address {0} does not match "
                                "request chip address {1}",
                                unsigned(frame->chipAddress),
                                unsigned(request.chipAddress)));
    return;
  }
  if (frame->status != ResponseStatus::Ok) {
    protocolError("SPI_MON_STATUS",
                  llvm::formatv("error status in response to read of "
                                "address {0:x2}",
                                unsigned(request.address)));
    return;
  }

  Observation obs;
  obs.direction = Direction::Read;
  obs.address = request.address;
  obs.data = frame->data;
  state = State::Idle;
  waitEdge(signals.csN, EdgeType::Negedge);
  emit(obs);
}

void SpiMonitor::resume() {
  if (!started) {
    started = true;
    waitEdge(signals.csN, EdgeType::Negedge);
    return;
  }

  switch (state) {
  case State::Stopped:
    return;

  case State::Idle:
    // Chip select fell: a request frame starts.
    state = State::Receiving;
    bitIndex = kFrameBits - 1;
    shiftReg = 0;
    waitEdge(signals.sclk, EdgeType::Negedge);
    return;

  case State::Receiving:
    if (!sampleBit(signals.mosi, getRequestFieldName(bitIndex)))
      return;
    if (--bitIndex >= 0) {
      waitEdge(signals.sclk, EdgeType::Negedge);
      return;
    }
    finishRequest();
    return;

  case State::AwaitingResponse:
    state = State::ReceivingResponse;
    bitIndex = kFrameBits - 1;
    shiftReg = 0;
    waitEdge(signals.sclk, EdgeType::Negedge);
    return;

  case State::ReceivingResponse:
    if (!sampleBit(signals.miso, getResponseFieldName(bitIndex)))
      return;
    if (--bitIndex >= 0) {
      waitEdge(signals.sclk, EdgeType::Negedge);
      return;
    }
    finishResponse();
    return;
  }
}
