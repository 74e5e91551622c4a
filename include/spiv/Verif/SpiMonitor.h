//===- SpiMonitor.h - Serial bus monitor ------------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the passive bus monitor. It samples request frames on
// the data output and, for reads, the response frame on the data input, and
// reports every completed transaction as an observation.
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_VERIF_SPIMONITOR_H
#define SPIV_VERIF_SPIMONITOR_H

#include "spiv/Sim/SimProcess.h"
#include "spiv/Sim/SimulationControl.h"
#include "spiv/Verif/FrameCodec.h"
#include "spiv/Verif/SpiDriver.h"
#include "spiv/Verif/Transaction.h"
#include <functional>

namespace spiv {
namespace verif {

/// Perpetual receiver:
///   Idle -> Receiving(31..0) -> [AwaitingResponse -> ReceivingResponse(31..0)]
///        -> Idle
/// Bits are sampled on falling clock edges. Protocol violations are fatal:
/// SPI_MON_UNDEF for an undefined sample, SPI_MON_FRAME for a malformed
/// frame, SPI_MON_CHIP for a chip address echo mismatch and SPI_MON_STATUS
/// for an error status.
class SpiMonitor : public sim::SimProcess {
public:
  using ObservationCallback = std::function<void(const Observation &)>;

  enum class State {
    Idle,
    Receiving,
    AwaitingResponse,
    ReceivingResponse,
    Stopped
  };

  SpiMonitor(sim::SignalHost &host, sim::SimulationControl &control,
             const SpiSignals &signals);

  void setObservationCallback(ObservationCallback callback) {
    onObservation = std::move(callback);
  }

  State getState() const { return state; }
  size_t getObservationCount() const { return observations; }

  /// The last request frame received, for diagnostics.
  const RequestFrame &getLastRequest() const { return request; }

protected:
  void resume() override;

private:
  /// Sample one bit of `signal` into `shiftReg`. Returns false on X.
  bool sampleBit(llvm::StringRef signal, const char *field);

  void finishRequest();
  void finishResponse();
  void emit(const Observation &obs);
  void protocolError(llvm::StringRef id, const llvm::Twine &message);

  sim::SimulationControl &control;
  const SpiSignals &signals;
  ObservationCallback onObservation;

  State state = State::Idle;
  bool started = false;
  int bitIndex = 0;
  uint32_t shiftReg = 0;
  RequestFrame request;
  size_t observations = 0;
};

} // namespace verif
} // namespace spiv

#endif // SPIV_VERIF_SPIMONITOR_H
