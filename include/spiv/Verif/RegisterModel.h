//===- RegisterModel.h - Shadow model of bus registers ----------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the verification-side copy of the bus-addressable
// registers: their layout, the values written so far, reset values and the
// per-register access history.
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_VERIF_REGISTERMODEL_H
#define SPIV_VERIF_REGISTERMODEL_H

#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/DenseMap.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Error.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace spiv {
namespace verif {

//===----------------------------------------------------------------------===//
// Direction and AccessMode
//===----------------------------------------------------------------------===//

/// Direction of a bus access.
enum class Direction : uint8_t { Read = 0, Write = 1 };

inline const char *getDirectionName(Direction dir) {
  return dir == Direction::Write ? "Write" : "Read";
}

/// Parse "Read"/"Write" (any case) or "r"/"w".
std::optional<Direction> parseDirection(llvm::StringRef str);

/// Access permissions of a register.
enum class AccessMode : uint8_t { ReadOnly = 0, ReadWrite = 1 };

inline const char *getAccessModeName(AccessMode mode) {
  return mode == AccessMode::ReadWrite ? "rw" : "ro";
}

//===----------------------------------------------------------------------===//
// RegisterEntry
//===----------------------------------------------------------------------===//

/// One bus-addressable register.
struct RegisterEntry {
  std::string name;
  uint8_t address = 0;
  uint8_t bitWidth = 1;
  AccessMode accessMode = AccessMode::ReadWrite;

  /// Value of the last write since the last reset.
  std::optional<uint32_t> lastWrittenValue;
  /// Value after reset, when known.
  std::optional<uint32_t> resetValue;
  /// Reads of unsupported registers are never checked.
  bool unsupported = false;

  /// Every access issued to this register, in order.
  std::vector<Direction> accessHistory;

  uint32_t getMaxValue() const { return (1u << bitWidth) - 1; }
  bool isReadOnly() const { return accessMode == AccessMode::ReadOnly; }

  /// Value a read is expected to return, or nullopt if it can't be known.
  std::optional<uint32_t> getExpectedReadValue() const {
    if (unsupported)
      return std::nullopt;
    if (lastWrittenValue)
      return lastWrittenValue;
    return resetValue;
  }

  size_t getAccessCount(Direction dir) const;
};

//===----------------------------------------------------------------------===//
// RegisterModel
//===----------------------------------------------------------------------===//

/// Load-time settings of the register map.
struct RegisterMapOptions {
  /// Chip address strapped on the device.
  uint8_t chipAddress = 0;
  /// Chip identifier reported by the chip id register.
  uint8_t chipId = 3;
  /// Register whose reset value is `(chipId << 4) | chipAddress`. Empty to
  /// disable.
  std::string chipIdRegister = "CHIP_ID_ADDR";
};

/// In-memory table of registers, ordered by address.
///
/// The JSON register map has the form
///   {"regs": {"NAME_ADDR": {"addr": 0, "bit_width": 8, "r_w": 1, ...}}}
/// An entry with `n_regs` > 1 declares an array. It expands into
/// `<BASE>_<i>_ADDR` at consecutive addresses, or, when `group_widths` is
/// given, into groups `<BASE><g>_<j>_ADDR` whose member `j` has bit width
/// `group_widths[j]`.
class RegisterModel {
public:
  RegisterModel() = default;

  /// Parse a register map from JSON text.
  static llvm::Expected<RegisterModel>
  loadFromJSON(llvm::StringRef text,
               const RegisterMapOptions &options = RegisterMapOptions());

  /// Load a register map from a JSON file.
  static llvm::Expected<RegisterModel>
  loadFromFile(llvm::StringRef path,
               const RegisterMapOptions &options = RegisterMapOptions());

  /// Add a register, validating its layout against the table.
  llvm::Error addRegister(RegisterEntry entry);

  const RegisterEntry *lookup(llvm::StringRef name) const;
  RegisterEntry *lookup(llvm::StringRef name);
  const RegisterEntry *lookupByAddress(uint8_t address) const;

  llvm::ArrayRef<RegisterEntry> getRegisters() const { return registers; }
  size_t size() const { return registers.size(); }
  bool empty() const { return registers.empty(); }

  /// Register names in address order.
  std::vector<std::string> getNames() const;

  /// Record a write. Fails for unknown or read-only registers and for data
  /// above the register's maximum value.
  llvm::Error recordWrite(llvm::StringRef name, uint32_t data);

  /// Append an access to the register's history.
  void recordAccess(llvm::StringRef name, Direction dir);

  /// The value a read of `name` is expected to return.
  std::optional<uint32_t> predictRead(llvm::StringRef name) const;

  /// Forget every written value. Reads fall back to reset values.
  void clearWrittenValues();

  /// Registers accessed fewer than `minRuns` times in the given direction.
  /// Read-only registers are not listed for writes.
  std::vector<std::string> getUnderExercised(Direction dir,
                                             size_t minRuns) const;

private:
  /// Sort by address and rebuild the lookup tables.
  void reindex();

  std::vector<RegisterEntry> registers;
  llvm::StringMap<size_t> byName;
  llvm::DenseMap<unsigned, size_t> byAddress;
};

} // namespace verif
} // namespace spiv

#endif // SPIV_VERIF_REGISTERMODEL_H
