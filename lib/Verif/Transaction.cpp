//===- Transaction.cpp - Register bus transaction -------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Verif/Transaction.h"
#include "llvm/Support/Format.h"

using namespace spiv;
using namespace spiv::verif;

static const DataRange allDataRanges[] = {DataRange::Min0, DataRange::Min1,
                                          DataRange::Mid, DataRange::Max1,
                                          DataRange::Max0};

llvm::ArrayRef<DataRange> spiv::verif::getAllDataRanges() {
  return allDataRanges;
}

std::optional<DataRange> spiv::verif::parseDataRange(llvm::StringRef str) {
  for (DataRange range : allDataRanges)
    if (str == getDataRangeName(range))
      return range;
  return std::nullopt;
}

std::optional<std::string>
Transaction::getField(llvm::StringRef field) const {
  if (field == "register_name")
    return registerName;
  if (field == "address")
    return std::to_string(address);
  if (field == "data")
    return std::to_string(data);
  if (field == "direction")
    return std::string(getDirectionName(direction));
  if (field == "data_range")
    return std::string(getDataRangeName(dataRange));
  if (field == "expected_read_value") {
    if (!expectedReadValue)
      return std::nullopt;
    return std::to_string(*expectedReadValue);
  }
  return std::nullopt;
}

llvm::raw_ostream &spiv::verif::operator<<(llvm::raw_ostream &os,
                                           const Transaction &trx) {
  os << getDirectionName(trx.direction) << " " << trx.registerName << " @"
     << llvm::format_hex(trx.address, 4);
  if (trx.isWrite())
    os << " data=" << llvm::format_hex(trx.data, 6) << " ("
       << getDataRangeName(trx.dataRange) << ")";
  else if (trx.expectedReadValue)
    os << " expect=" << llvm::format_hex(*trx.expectedReadValue, 6);
  return os;
}

llvm::raw_ostream &spiv::verif::operator<<(llvm::raw_ostream &os,
                                           const Observation &obs) {
  return os << getDirectionName(obs.direction) << " @"
            << llvm::format_hex(obs.address, 4)
            << " data=" << llvm::format_hex(obs.data, 6);
}
