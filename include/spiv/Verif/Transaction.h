//===- Transaction.h - Register bus transaction -----------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the transaction record exchanged between the stimulus
// generator, the bus driver, the scoreboard and the coverage engine.
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_VERIF_TRANSACTION_H
#define SPIV_VERIF_TRANSACTION_H

#include "spiv/Verif/RegisterModel.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"
#include <optional>
#include <string>

namespace spiv {
namespace verif {

/// Class of the data value of a write, relative to the register's range.
enum class DataRange : uint8_t {
  /// 0
  Min0 = 0,
  /// 1
  Min1 = 1,
  /// Strictly inside the range.
  Mid = 2,
  /// max - 1
  Max1 = 3,
  /// max
  Max0 = 4,
};

inline const char *getDataRangeName(DataRange range) {
  switch (range) {
  case DataRange::Min0:
    return "Min0";
  case DataRange::Min1:
    return "Min1";
  case DataRange::Mid:
    return "Mid";
  case DataRange::Max1:
    return "Max1";
  case DataRange::Max0:
    return "Max0";
  }
  return "Unknown";
}

std::optional<DataRange> parseDataRange(llvm::StringRef str);

/// All data range classes in declaration order.
llvm::ArrayRef<DataRange> getAllDataRanges();

/// One register access.
struct Transaction {
  std::string registerName;
  uint8_t address = 0;
  uint16_t data = 0;
  Direction direction = Direction::Read;
  DataRange dataRange = DataRange::Min0;

  /// Filled in right before transmission for reads.
  std::optional<uint32_t> expectedReadValue;

  bool isRead() const { return direction == Direction::Read; }
  bool isWrite() const { return direction == Direction::Write; }

  /// Look up a field by name: register_name, address, data, direction,
  /// data_range or expected_read_value. Returns nullopt for unknown fields
  /// and unset values.
  std::optional<std::string> getField(llvm::StringRef field) const;
};

llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Transaction &trx);

/// What the bus monitor saw on the wire for one transaction.
struct Observation {
  Direction direction = Direction::Read;
  uint8_t address = 0;
  uint16_t data = 0;
};

llvm::raw_ostream &operator<<(llvm::raw_ostream &os, const Observation &obs);

} // namespace verif
} // namespace spiv

#endif // SPIV_VERIF_TRANSACTION_H
