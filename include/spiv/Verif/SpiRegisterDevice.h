//===- SpiRegisterDevice.h - Behavioural register bus slave -----*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines a behavioural model of the device under test: a register
// file behind the serial bus. Writes land in a bus-side shadow register and
// are committed to the core side at once, or at the next falling edge of the
// MCE pulse while the pulse is high.
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_VERIF_SPIREGISTERDEVICE_H
#define SPIV_VERIF_SPIREGISTERDEVICE_H

#include "spiv/Sim/SimProcess.h"
#include "spiv/Verif/FrameCodec.h"
#include "spiv/Verif/RegisterModel.h"
#include "spiv/Verif/SpiDriver.h"
#include "llvm/ADT/DenseMap.h"
#include <optional>
#include <string>

namespace spiv {
namespace verif {

class SpiRegisterDevice : public sim::SimProcess {
public:
  /// The device takes its register layout from `layout`. It keeps its own
  /// register values.
  SpiRegisterDevice(sim::SignalHost &host, const RegisterModel &layout,
                    uint8_t chipAddress, const SpiSignals &signals,
                    llvm::StringRef mceSignal = "mce");

  /// Writing `code` to `address` resets every register.
  void setResetCommand(uint8_t address, uint16_t code) {
    resetCommand = std::make_pair(address, code);
  }

  /// Start the bus process and the commit process watching MCE.
  void start() override;

  /// Bus-side value of a register, nullopt if unmapped.
  std::optional<uint32_t> getShadowValue(uint8_t address) const;

  /// Core-side value of a register, nullopt if unmapped.
  std::optional<uint32_t> getCoreValue(uint8_t address) const;

  size_t getFramesReceived() const { return framesReceived; }
  size_t getFramesIgnored() const { return framesIgnored; }
  size_t getPostponedWrites() const { return postponedWrites; }
  size_t getResets() const { return resets; }

protected:
  void resume() override;

private:
  struct DeviceRegister {
    uint32_t maxValue = 0;
    bool readOnly = false;
    uint32_t resetValue = 0;
    uint32_t shadow = 0;
    uint32_t core = 0;
    bool commitPending = false;
  };

  enum class State { Idle, Shifting, AwaitStop, Responding, AwaitResponseEnd };

  void processFrame();
  void applyWrite(const RequestFrame &frame);
  void prepareResponse(const RequestFrame &frame);
  void resetRegisters();
  void commitPending();

  const SpiSignals &signals;
  std::string mceSignal;
  uint8_t chipAddress;
  llvm::DenseMap<unsigned, DeviceRegister> registers;
  std::optional<std::pair<uint8_t, uint16_t>> resetCommand;

  State state = State::Idle;
  bool started = false;
  int bitIndex = 0;
  uint32_t shiftReg = 0;
  bool corrupt = false;
  bool responsePending = false;
  uint32_t response = 0;

  sim::ProcessId commitPid = sim::InvalidProcessId;

  size_t framesReceived = 0;
  size_t framesIgnored = 0;
  size_t postponedWrites = 0;
  size_t resets = 0;
};

} // namespace verif
} // namespace spiv

#endif // SPIV_VERIF_SPIREGISTERDEVICE_H
