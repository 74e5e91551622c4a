//===- RegisterModel.cpp - Shadow model of bus registers ------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements the register model and the JSON register map loader.
//
//===----------------------------------------------------------------------===//

#include "spiv/Verif/RegisterModel.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/FormatVariadic.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/MemoryBuffer.h"
#include <algorithm>

#define DEBUG_TYPE "spiv-register-model"

using namespace spiv;
using namespace spiv::verif;
using llvm::StringRef;

std::optional<Direction> spiv::verif::parseDirection(StringRef str) {
  std::string lower = str.lower();
  if (lower == "read" || lower == "r")
    return Direction::Read;
  if (lower == "write" || lower == "w")
    return Direction::Write;
  return std::nullopt;
}

size_t RegisterEntry::getAccessCount(Direction dir) const {
  return std::count(accessHistory.begin(), accessHistory.end(), dir);
}

//===----------------------------------------------------------------------===//
// Table maintenance
//===----------------------------------------------------------------------===//

llvm::Error RegisterModel::addRegister(RegisterEntry entry) {
  if (entry.name.empty())
    return llvm::createStringError(std::errc::invalid_argument,
                                   "register without a name");
  if (entry.bitWidth < 1 || entry.bitWidth > 16)
    return llvm::createStringError(
        std::errc::invalid_argument,
        "register '%s' has bit width %u, expected 1..16", entry.name.c_str(),
        static_cast<unsigned>(entry.bitWidth));
  if (byName.count(entry.name))
    return llvm::createStringError(std::errc::invalid_argument,
                                   "duplicate register '%s'",
                                   entry.name.c_str());
  auto clash = byAddress.find(entry.address);
  if (clash != byAddress.end())
    return llvm::createStringError(
        std::errc::invalid_argument,
        "register '%s' reuses address 0x%02x of '%s'", entry.name.c_str(),
        static_cast<unsigned>(entry.address),
        registers[clash->second].name.c_str());
  if (entry.resetValue && *entry.resetValue > entry.getMaxValue())
    return llvm::createStringError(
        std::errc::invalid_argument,
        "register '%s' reset value %u exceeds maximum %u", entry.name.c_str(),
        *entry.resetValue, entry.getMaxValue());

  size_t index = registers.size();
  byName[entry.name] = index;
  byAddress[entry.address] = index;
  registers.push_back(std::move(entry));
  return llvm::Error::success();
}

void RegisterModel::reindex() {
  std::stable_sort(registers.begin(), registers.end(),
                   [](const RegisterEntry &lhs, const RegisterEntry &rhs) {
                     return lhs.address < rhs.address;
                   });
  byName.clear();
  byAddress.clear();
  for (size_t i = 0, e = registers.size(); i != e; ++i) {
    byName[registers[i].name] = i;
    byAddress[registers[i].address] = i;
  }
}

const RegisterEntry *RegisterModel::lookup(StringRef name) const {
  auto it = byName.find(name);
  return it == byName.end() ? nullptr : &registers[it->second];
}

RegisterEntry *RegisterModel::lookup(StringRef name) {
  auto it = byName.find(name);
  return it == byName.end() ? nullptr : &registers[it->second];
}

const RegisterEntry *RegisterModel::lookupByAddress(uint8_t address) const {
  auto it = byAddress.find(address);
  return it == byAddress.end() ? nullptr : &registers[it->second];
}

std::vector<std::string> RegisterModel::getNames() const {
  std::vector<std::string> names;
  names.reserve(registers.size());
  for (const auto &reg : registers)
    names.push_back(reg.name);
  return names;
}

//===----------------------------------------------------------------------===//
// Run-time state
//===----------------------------------------------------------------------===//

llvm::Error RegisterModel::recordWrite(StringRef name, uint32_t data) {
  RegisterEntry *reg = lookup(name);
  if (!reg)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "write to unknown register '%s'",
                                   name.str().c_str());
  if (reg->isReadOnly())
    return llvm::createStringError(std::errc::permission_denied,
                                   "write to read-only register '%s'",
                                   reg->name.c_str());
  if (data > reg->getMaxValue())
    return llvm::createStringError(
        std::errc::result_out_of_range,
        "data 0x%x exceeds maximum 0x%x of register '%s'", data,
        reg->getMaxValue(), reg->name.c_str());

  reg->lastWrittenValue = data;
  return llvm::Error::success();
}

void RegisterModel::recordAccess(StringRef name, Direction dir) {
  if (RegisterEntry *reg = lookup(name))
    reg->accessHistory.push_back(dir);
}

std::optional<uint32_t> RegisterModel::predictRead(StringRef name) const {
  const RegisterEntry *reg = lookup(name);
  if (!reg)
    return std::nullopt;
  return reg->getExpectedReadValue();
}

void RegisterModel::clearWrittenValues() {
  for (auto &reg : registers)
    reg.lastWrittenValue.reset();
}

std::vector<std::string>
RegisterModel::getUnderExercised(Direction dir, size_t minRuns) const {
  std::vector<std::string> result;
  for (const auto &reg : registers) {
    if (dir == Direction::Write && reg.isReadOnly())
      continue;
    if (reg.getAccessCount(dir) < minRuns)
      result.push_back(reg.name);
  }
  return result;
}

//===----------------------------------------------------------------------===//
// JSON register map
//===----------------------------------------------------------------------===//

namespace {

/// Fields of one register map record, before array expansion.
struct RegisterRecord {
  std::string name;
  int64_t address = -1;
  int64_t bitWidth = 0;
  AccessMode accessMode = AccessMode::ReadWrite;
  std::optional<int64_t> resetValue;
  int64_t count = 1;
  std::vector<int64_t> groupWidths;
  bool unsupported = false;
};

llvm::Error invalidRecord(StringRef name, const llvm::Twine &message) {
  return llvm::createStringError(std::errc::invalid_argument,
                                 "register '%s': %s", name.str().c_str(),
                                 message.str().c_str());
}

llvm::Expected<RegisterRecord> parseRecord(StringRef name,
                                           const llvm::json::Value &value) {
  const auto *obj = value.getAsObject();
  if (!obj)
    return invalidRecord(name, "expected an object");

  RegisterRecord record;
  record.name = name.str();

  if (auto addr = obj->getInteger("addr"))
    record.address = *addr;
  else
    return invalidRecord(name, "missing integer 'addr'");
  if (record.address < 0 || record.address > 255)
    return invalidRecord(name, llvm::formatv("address {0} does not fit 8 bits",
                                             record.address));

  if (auto width = obj->getInteger("bit_width"))
    record.bitWidth = *width;
  else
    return invalidRecord(name, "missing integer 'bit_width'");

  // r_w is 0/1 in generated maps, "ro"/"rw" in hand-written ones.
  if (const auto *rw = obj->get("r_w")) {
    if (auto flag = rw->getAsInteger()) {
      if (*flag != 0 && *flag != 1)
        return invalidRecord(name, "'r_w' must be 0 or 1");
      record.accessMode = *flag ? AccessMode::ReadWrite : AccessMode::ReadOnly;
    } else if (auto str = rw->getAsString()) {
      if (str->equals_insensitive("ro"))
        record.accessMode = AccessMode::ReadOnly;
      else if (str->equals_insensitive("rw"))
        record.accessMode = AccessMode::ReadWrite;
      else
        return invalidRecord(name, "'r_w' must be \"ro\" or \"rw\"");
    } else {
      return invalidRecord(name, "invalid 'r_w'");
    }
  }

  if (auto resetValue = obj->getInteger("reg_value")) {
    if (*resetValue < 0)
      return invalidRecord(name, "negative 'reg_value'");
    record.resetValue = *resetValue;
  }

  if (auto count = obj->getInteger("n_regs"))
    record.count = *count;
  if (record.count < 1)
    return invalidRecord(name, "'n_regs' must be positive");

  if (const auto *widths = obj->getArray("group_widths")) {
    for (const auto &width : *widths) {
      auto w = width.getAsInteger();
      if (!w)
        return invalidRecord(name, "'group_widths' must hold integers");
      record.groupWidths.push_back(*w);
    }
    if (record.groupWidths.empty())
      return invalidRecord(name, "empty 'group_widths'");
    if (record.count % record.groupWidths.size() != 0)
      return invalidRecord(
          name, llvm::formatv("'n_regs' {0} is not a multiple of the group "
                              "size {1}",
                              record.count, record.groupWidths.size()));
  }

  if (const auto *flag = obj->get("unsupported")) {
    if (auto b = flag->getAsBoolean())
      record.unsupported = *b;
    else if (auto i = flag->getAsInteger())
      record.unsupported = *i != 0;
  }
  return record;
}

/// Name stem of an array declaration: "ANODE_BIAS_ADDR" -> "ANODE_BIAS".
StringRef getArrayBase(StringRef name) {
  StringRef base = name;
  if (base.endswith("_ADDR"))
    base = base.drop_back(5);
  return base;
}

llvm::Error expandRecord(const RegisterRecord &record, RegisterModel &model) {
  auto makeEntry = [&](std::string name, int64_t address,
                       int64_t width) -> llvm::Expected<RegisterEntry> {
    if (address > 255)
      return invalidRecord(record.name,
                           llvm::formatv("array member '{0}' at address {1} "
                                         "does not fit 8 bits",
                                         name, address));
    if (width < 1 || width > 16)
      return invalidRecord(
          name, llvm::formatv("bit width {0}, expected 1..16", width));
    RegisterEntry entry;
    entry.name = std::move(name);
    entry.address = static_cast<uint8_t>(address);
    entry.bitWidth = static_cast<uint8_t>(width);
    entry.accessMode = record.accessMode;
    entry.unsupported = record.unsupported;
    if (record.resetValue)
      entry.resetValue = static_cast<uint32_t>(*record.resetValue);
    return entry;
  };

  auto add = [&](std::string name, int64_t address,
                 int64_t width) -> llvm::Error {
    auto entry = makeEntry(std::move(name), address, width);
    if (!entry)
      return entry.takeError();
    return model.addRegister(std::move(*entry));
  };

  if (record.count == 1 && record.groupWidths.empty())
    return add(record.name, record.address, record.bitWidth);

  StringRef base = getArrayBase(record.name);
  if (record.groupWidths.empty()) {
    for (int64_t i = 0; i < record.count; ++i)
      if (auto err = add(llvm::formatv("{0}_{1}_ADDR", base, i).str(),
                         record.address + i, record.bitWidth))
        return err;
    return llvm::Error::success();
  }

  int64_t groupSize = record.groupWidths.size();
  for (int64_t g = 0; g < record.count / groupSize; ++g)
    for (int64_t j = 0; j < groupSize; ++j)
      if (auto err = add(llvm::formatv("{0}{1}_{2}_ADDR", base, g, j).str(),
                         record.address + g * groupSize + j,
                         record.groupWidths[j]))
        return err;
  return llvm::Error::success();
}

} // namespace

llvm::Expected<RegisterModel>
RegisterModel::loadFromJSON(StringRef text, const RegisterMapOptions &options) {
  auto jsonOrErr = llvm::json::parse(text);
  if (!jsonOrErr)
    return jsonOrErr.takeError();

  auto *root = jsonOrErr->getAsObject();
  if (!root)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "register map must be a JSON object");
  auto *regs = root->getObject("regs");
  if (!regs)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "register map has no 'regs' object");

  // json::Object is unordered; sort the records for stable diagnostics.
  std::vector<RegisterRecord> records;
  for (const auto &kv : *regs) {
    auto record = parseRecord(kv.first, kv.second);
    if (!record)
      return record.takeError();
    records.push_back(std::move(*record));
  }
  std::sort(records.begin(), records.end(),
            [](const RegisterRecord &lhs, const RegisterRecord &rhs) {
              return lhs.address < rhs.address;
            });

  RegisterModel model;
  for (const auto &record : records)
    if (auto err = expandRecord(record, model))
      return std::move(err);
  model.reindex();

  if (!options.chipIdRegister.empty()) {
    if (RegisterEntry *chipId = model.lookup(options.chipIdRegister)) {
      uint32_t value = (static_cast<uint32_t>(options.chipId) << 4) |
                       options.chipAddress;
      if (value > chipId->getMaxValue())
        return llvm::createStringError(
            std::errc::invalid_argument,
            "chip id value 0x%x does not fit register '%s'", value,
            chipId->name.c_str());
      chipId->resetValue = value;
    }
  }

  LLVM_DEBUG(llvm::dbgs() << "Loaded " << model.size() << " registers from "
                          << records.size() << " records\n");
  return std::move(model);
}

llvm::Expected<RegisterModel>
RegisterModel::loadFromFile(StringRef path, const RegisterMapOptions &options) {
  auto bufferOrErr = llvm::MemoryBuffer::getFile(path);
  if (!bufferOrErr)
    return llvm::createStringError(bufferOrErr.getError(),
                                   "Failed to open register map '%s'",
                                   path.str().c_str());
  return loadFromJSON(bufferOrErr.get()->getBuffer(), options);
}
