//===- FrameCodec.cpp - Serial bus frame layout ---------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Verif/FrameCodec.h"

using namespace spiv;
using namespace spiv::verif;

//===----------------------------------------------------------------------===//
// Request frames
//===----------------------------------------------------------------------===//

uint32_t spiv::verif::encodeRequest(const RequestFrame &frame) {
  using namespace request;
  uint32_t bits = 0;
  bits |= static_cast<uint32_t>(frame.chipAddress & 0x7) << kChipShift;
  bits |= static_cast<uint32_t>(frame.write) << kWriteShift;
  bits |= static_cast<uint32_t>(frame.broadcast) << kBroadcastShift;
  bits |= static_cast<uint32_t>(frame.address) << kAddressShift;
  bits |= static_cast<uint32_t>(frame.data) << kDataShift;
  bits |= 1u << kStopShift;
  return bits;
}

llvm::Expected<RequestFrame> spiv::verif::decodeRequest(uint32_t bits) {
  using namespace request;
  if (!((bits >> kStopShift) & 1))
    return llvm::createStringError(std::errc::illegal_byte_sequence,
                                   "request frame 0x%08x has no stop bit",
                                   bits);
  if ((bits >> kReservedShift) & 0x3)
    return llvm::createStringError(std::errc::illegal_byte_sequence,
                                   "request frame 0x%08x has reserved bits set",
                                   bits);

  RequestFrame frame;
  frame.chipAddress = (bits >> kChipShift) & 0x7;
  frame.write = (bits >> kWriteShift) & 1;
  frame.broadcast = (bits >> kBroadcastShift) & 1;
  frame.address = (bits >> kAddressShift) & 0xff;
  frame.data = (bits >> kDataShift) & 0xffff;
  return frame;
}

//===----------------------------------------------------------------------===//
// Response frames
//===----------------------------------------------------------------------===//

uint32_t spiv::verif::encodeResponse(const ResponseFrame &frame) {
  using namespace response;
  uint32_t bits = 1u << kMarkerShift;
  bits |= static_cast<uint32_t>(frame.chipAddress & 0x7) << kChipShift;
  bits |= static_cast<uint32_t>(frame.write) << kWriteShift;
  bits |= static_cast<uint32_t>(frame.broadcast) << kBroadcastShift;
  bits |= static_cast<uint32_t>(frame.data) << kDataShift;
  bits |= static_cast<uint32_t>(frame.status) << kStatusShift;
  return bits;
}

llvm::Expected<ResponseFrame> spiv::verif::decodeResponse(uint32_t bits) {
  using namespace response;
  // Bits 31..25 must read 0000001, bits 2..0 must be zero.
  if ((bits >> kMarkerShift) != 1 || (bits & 0x7))
    return llvm::createStringError(std::errc::illegal_byte_sequence,
                                   "malformed response frame 0x%08x", bits);

  ResponseFrame frame;
  frame.chipAddress = (bits >> kChipShift) & 0x7;
  frame.write = (bits >> kWriteShift) & 1;
  frame.broadcast = (bits >> kBroadcastShift) & 1;
  frame.data = (bits >> kDataShift) & 0xffff;
  frame.status = ((bits >> kStatusShift) & 1) ? ResponseStatus::Error
                                               : ResponseStatus::Ok;
  return frame;
}

//===----------------------------------------------------------------------===//
// Transactions
//===----------------------------------------------------------------------===//

RequestFrame spiv::verif::makeRequest(const Transaction &trx,
                                      uint8_t chipAddress) {
  RequestFrame frame;
  frame.chipAddress = chipAddress;
  frame.write = trx.isWrite();
  frame.address = trx.address;
  frame.data = trx.isWrite() ? trx.data : 0;
  return frame;
}

llvm::Error spiv::verif::validateTransaction(const Transaction &trx,
                                             unsigned chipAddress,
                                             const RegisterModel &model) {
  if (chipAddress > kMaxChipAddress)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "chip address %u does not fit 3 bits",
                                   chipAddress);

  const RegisterEntry *reg = model.lookup(trx.registerName);
  if (!reg)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "unknown register '%s'",
                                   trx.registerName.c_str());
  if (reg->address != trx.address)
    return llvm::createStringError(
        std::errc::invalid_argument,
        "register '%s' lives at 0x%02x, transaction addresses 0x%02x",
        reg->name.c_str(), static_cast<unsigned>(reg->address),
        static_cast<unsigned>(trx.address));

  if (trx.isWrite()) {
    if (reg->isReadOnly())
      return llvm::createStringError(std::errc::invalid_argument,
                                     "write to read-only register '%s'",
                                     reg->name.c_str());
    if (trx.data > reg->getMaxValue())
      return llvm::createStringError(
          std::errc::invalid_argument,
          "data 0x%x exceeds maximum 0x%x of register '%s'",
          static_cast<unsigned>(trx.data), reg->getMaxValue(),
          reg->name.c_str());
  }
  return llvm::Error::success();
}

//===----------------------------------------------------------------------===//
// Tracing
//===----------------------------------------------------------------------===//

const char *spiv::verif::getRequestFieldName(unsigned bit) {
  using namespace request;
  if (bit >= kChipShift)
    return "chip";
  if (bit == kWriteShift)
    return "wrn";
  if (bit == kBroadcastShift)
    return "br";
  if (bit >= kAddressShift)
    return "addr";
  if (bit >= kDataShift)
    return "data";
  if (bit >= kReservedShift)
    return "rsv";
  return "stop";
}

const char *spiv::verif::getResponseFieldName(unsigned bit) {
  using namespace response;
  if (bit > kMarkerShift)
    return "zero";
  if (bit == kMarkerShift)
    return "one";
  if (bit >= kChipShift)
    return "chip";
  if (bit == kWriteShift)
    return "wrn";
  if (bit == kBroadcastShift)
    return "br";
  if (bit >= kDataShift)
    return "data";
  if (bit == kStatusShift)
    return "status";
  return "zero";
}
