//===- FrameCodec.h - Serial bus frame layout -------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the bit-exact layout of the 32-bit request and response
// frames of the register bus. Frames travel MSB first.
//
// Request:  chip(3) | wrn(1) | broadcast(1) | addr(8) | data(16) | rsv(2) |
//           stop(1) = 1
// Response: zero(6) | one(1) | chip(3) | wrn(1) | broadcast(1) | data(16) |
//           status(1) | zero(3)
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_VERIF_FRAMECODEC_H
#define SPIV_VERIF_FRAMECODEC_H

#include "spiv/Verif/RegisterModel.h"
#include "spiv/Verif/Transaction.h"
#include "llvm/Support/Error.h"
#include <cstdint>

namespace spiv {
namespace verif {

/// Number of bits in every frame.
constexpr unsigned kFrameBits = 32;

/// Largest chip address (3 bits).
constexpr unsigned kMaxChipAddress = 7;

namespace request {
constexpr unsigned kChipShift = 29;
constexpr unsigned kWriteShift = 28;
constexpr unsigned kBroadcastShift = 27;
constexpr unsigned kAddressShift = 19;
constexpr unsigned kDataShift = 3;
constexpr unsigned kReservedShift = 1;
constexpr unsigned kStopShift = 0;
} // namespace request

namespace response {
constexpr unsigned kMarkerShift = 25;
constexpr unsigned kChipShift = 22;
constexpr unsigned kWriteShift = 21;
constexpr unsigned kBroadcastShift = 20;
constexpr unsigned kDataShift = 4;
constexpr unsigned kStatusShift = 3;
} // namespace response

enum class ResponseStatus : uint8_t { Ok = 0, Error = 1 };

/// Decoded fields of a request frame.
struct RequestFrame {
  uint8_t chipAddress = 0;
  bool write = false;
  bool broadcast = false;
  uint8_t address = 0;
  uint16_t data = 0;

  bool operator==(const RequestFrame &other) const {
    return chipAddress == other.chipAddress && write == other.write &&
           broadcast == other.broadcast && address == other.address &&
           data == other.data;
  }
};

/// Decoded fields of a response frame.
struct ResponseFrame {
  uint8_t chipAddress = 0;
  bool write = false;
  bool broadcast = false;
  uint16_t data = 0;
  ResponseStatus status = ResponseStatus::Ok;

  bool operator==(const ResponseFrame &other) const {
    return chipAddress == other.chipAddress && write == other.write &&
           broadcast == other.broadcast && data == other.data &&
           status == other.status;
  }
};

/// Pack a request frame. The chip address is truncated to 3 bits.
uint32_t encodeRequest(const RequestFrame &frame);

/// Unpack a request frame. Fails when the stop bit is missing or the
/// reserved bits are set.
llvm::Expected<RequestFrame> decodeRequest(uint32_t bits);

/// Pack a response frame.
uint32_t encodeResponse(const ResponseFrame &frame);

/// Unpack a response frame. Fails when the marker bits are wrong.
llvm::Expected<ResponseFrame> decodeResponse(uint32_t bits);

/// The request frame carrying a transaction. Reads carry no data.
RequestFrame makeRequest(const Transaction &trx, uint8_t chipAddress);

/// Check a transaction against the chip address and the register map before
/// it is driven.
llvm::Error validateTransaction(const Transaction &trx, unsigned chipAddress,
                                const RegisterModel &model);

/// Name of the request field bit `bit` belongs to, for tracing.
const char *getRequestFieldName(unsigned bit);

/// Name of the response field bit `bit` belongs to, for tracing.
const char *getResponseFieldName(unsigned bit);

} // namespace verif
} // namespace spiv

#endif // SPIV_VERIF_FRAMECODEC_H
