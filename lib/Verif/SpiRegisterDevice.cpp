//===- SpiRegisterDevice.cpp - Behavioural register bus slave -------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Verif/SpiRegisterDevice.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/Format.h"

#define DEBUG_TYPE "spiv-device"

using namespace spiv;
using namespace spiv::verif;
using sim::EdgeType;

SpiRegisterDevice::SpiRegisterDevice(sim::SignalHost &host,
                                     const RegisterModel &layout,
                                     uint8_t chipAddress,
                                     const SpiSignals &signals,
                                     llvm::StringRef mceSignal)
    : SimProcess(host, "spi_device"), signals(signals),
      mceSignal(mceSignal.str()), chipAddress(chipAddress) {
  for (const auto &entry : layout.getRegisters()) {
    DeviceRegister reg;
    reg.maxValue = entry.getMaxValue();
    reg.readOnly = entry.isReadOnly();
    reg.resetValue = entry.resetValue.value_or(0);
    reg.shadow = reg.core = reg.resetValue;
    registers[entry.address] = reg;
  }
}

void SpiRegisterDevice::start() {
  SimProcess::start();
  if (commitPid != sim::InvalidProcessId)
    return;
  commitPid = host.spawn("spi_device_commit", [this]() {
    commitPending();
    host.waitEdge(commitPid, mceSignal, EdgeType::Negedge);
  });
}

std::optional<uint32_t>
SpiRegisterDevice::getShadowValue(uint8_t address) const {
  auto it = registers.find(address);
  if (it == registers.end())
    return std::nullopt;
  return it->second.shadow;
}

std::optional<uint32_t> SpiRegisterDevice::getCoreValue(uint8_t address) const {
  auto it = registers.find(address);
  if (it == registers.end())
    return std::nullopt;
  return it->second.core;
}

//===----------------------------------------------------------------------===//
// Register file
//===----------------------------------------------------------------------===//

void SpiRegisterDevice::resetRegisters() {
  for (auto &kv : registers) {
    DeviceRegister &reg = kv.second;
    reg.shadow = reg.core = reg.resetValue;
    reg.commitPending = false;
  }
  ++resets;
  LLVM_DEBUG(llvm::dbgs() << "device reset at " << host.now() << "\n");
}

void SpiRegisterDevice::commitPending() {
  for (auto &kv : registers) {
    DeviceRegister &reg = kv.second;
    if (!reg.commitPending)
      continue;
    reg.core = reg.shadow;
    reg.commitPending = false;
    LLVM_DEBUG(llvm::dbgs() << "commit postponed write to "
                            << llvm::format_hex(kv.first, 4) << "\n");
  }
}

void SpiRegisterDevice::applyWrite(const RequestFrame &frame) {
  if (resetCommand && frame.address == resetCommand->first &&
      frame.data == resetCommand->second) {
    resetRegisters();
    return;
  }

  auto it = registers.find(frame.address);
  if (it == registers.end() || it->second.readOnly)
    return;

  DeviceRegister &reg = it->second;
  reg.shadow = frame.data & reg.maxValue;

  // While MCE is high the core side is busy; the write waits for its end.
  sim::SignalValue mce = host.readSignal(mceSignal);
  if (!mce.isUnknown() && mce.getLSB()) {
    reg.commitPending = true;
    ++postponedWrites;
  } else {
    reg.core = reg.shadow;
  }
}

void SpiRegisterDevice::prepareResponse(const RequestFrame &frame) {
  ResponseFrame resp;
  resp.chipAddress = chipAddress;
  resp.write = false;
  resp.broadcast = frame.broadcast;

  auto it = registers.find(frame.address);
  if (it == registers.end()) {
    resp.status = ResponseStatus::Error;
  } else {
    resp.data = it->second.shadow;
  }
  response = encodeResponse(resp);
  responsePending = true;
}

void SpiRegisterDevice::processFrame() {
  ++framesReceived;
  if (corrupt) {
    ++framesIgnored;
    return;
  }
  auto frame = decodeRequest(shiftReg);
  if (!frame) {
    LLVM_DEBUG(llvm::dbgs() << "ignored frame: "
                            << llvm::toString(frame.takeError()) << "\n");
    ++framesIgnored;
    return;
  }
  // Broadcast writes address every chip.
  bool forUs = frame->chipAddress == chipAddress ||
               (frame->broadcast && frame->write);
  if (!forUs) {
    ++framesIgnored;
    return;
  }
  if (frame->write)
    applyWrite(*frame);
  else
    prepareResponse(*frame);
}

//===----------------------------------------------------------------------===//
// Bus process
//===----------------------------------------------------------------------===//

void SpiRegisterDevice::resume() {
  if (!started) {
    started = true;
    waitEdge(signals.csN, EdgeType::Negedge);
    return;
  }

  switch (state) {
  case State::Idle:
    bitIndex = kFrameBits - 1;
    if (responsePending) {
      state = State::Responding;
      waitEdge(signals.sclk, EdgeType::Posedge);
      return;
    }
    state = State::Shifting;
    shiftReg = 0;
    corrupt = false;
    waitEdge(signals.sclk, EdgeType::Negedge);
    return;

  case State::Shifting: {
    sim::SignalValue bit = host.readSignal(signals.mosi);
    if (bit.isUnknown())
      corrupt = true;
    else
      shiftReg |= static_cast<uint32_t>(bit.getLSB()) << bitIndex;
    if (--bitIndex < 0) {
      state = State::AwaitStop;
      waitEdge(signals.csN, EdgeType::Posedge);
    } else {
      waitEdge(signals.sclk, EdgeType::Negedge);
    }
    return;
  }

  case State::AwaitStop:
    processFrame();
    state = State::Idle;
    waitEdge(signals.csN, EdgeType::Negedge);
    return;

  case State::Responding:
    host.writeBit(signals.miso, (response >> bitIndex) & 1);
    if (--bitIndex < 0) {
      state = State::AwaitResponseEnd;
      waitEdge(signals.csN, EdgeType::Posedge);
    } else {
      waitEdge(signals.sclk, EdgeType::Posedge);
    }
    return;

  case State::AwaitResponseEnd:
    host.release(signals.miso);
    responsePending = false;
    state = State::Idle;
    waitEdge(signals.csN, EdgeType::Negedge);
    return;
  }
}
