//===- StimulusGenerator.cpp - Constrained-random transactions ------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Verif/StimulusGenerator.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/Support/Debug.h"
#include <algorithm>

#define DEBUG_TYPE "spiv-stimulus"

using namespace spiv;
using namespace spiv::verif;

//===----------------------------------------------------------------------===//
// StimulusGenerator
//===----------------------------------------------------------------------===//

StimulusGenerator::StimulusGenerator(std::mt19937 &rng,
                                     const StimulusWeights &weights)
    : rng(rng), weights(weights) {
  // A zero weight would starve registers and stall closure.
  if (this->weights.coveredWeight == 0)
    this->weights.coveredWeight = 1;
  if (this->weights.uncoveredWeight == 0)
    this->weights.uncoveredWeight = 1;
}

unsigned StimulusGenerator::getDataRangeWeight(DataRange range) {
  return range == DataRange::Mid ? 2 : 1;
}

const RegisterEntry &
StimulusGenerator::pickRegister(const RegisterModel &model,
                                const llvm::StringSet<> &covered) {
  llvm::SmallVector<unsigned, 64> regWeights;
  for (const auto &reg : model.getRegisters())
    regWeights.push_back(covered.count(reg.name) ? weights.coveredWeight
                                                 : weights.uncoveredWeight);
  std::discrete_distribution<size_t> dist(regWeights.begin(),
                                          regWeights.end());
  return model.getRegisters()[dist(rng)];
}

Direction StimulusGenerator::pickDirection(const RegisterEntry &reg) {
  if (reg.isReadOnly())
    return Direction::Read;
  std::uniform_int_distribution<int> coin(0, 1);
  return coin(rng) ? Direction::Write : Direction::Read;
}

DataRange StimulusGenerator::pickDataRange() {
  llvm::ArrayRef<DataRange> ranges = getAllDataRanges();
  llvm::SmallVector<unsigned, 5> rangeWeights;
  for (DataRange range : ranges)
    rangeWeights.push_back(getDataRangeWeight(range));
  std::discrete_distribution<size_t> dist(rangeWeights.begin(),
                                          rangeWeights.end());
  return ranges[dist(rng)];
}

uint32_t StimulusGenerator::pickData(DataRange range, uint32_t maxValue) {
  switch (range) {
  case DataRange::Min0:
    return 0;
  case DataRange::Min1:
    return std::min<uint32_t>(1, maxValue);
  case DataRange::Max0:
    return maxValue;
  case DataRange::Max1:
    return maxValue ? maxValue - 1 : 0;
  case DataRange::Mid:
    break;
  }
  if (maxValue < 4) {
    std::uniform_int_distribution<uint32_t> any(0, maxValue);
    return any(rng);
  }
  std::uniform_int_distribution<uint32_t> inner(2, maxValue - 2);
  return inner(rng);
}

llvm::Expected<Transaction>
StimulusGenerator::next(const RegisterModel &model,
                        const llvm::StringSet<> &covered) {
  if (model.empty())
    return llvm::createStringError(std::errc::invalid_argument,
                                   "register model has no registers");

  const RegisterEntry &reg = pickRegister(model, covered);

  Transaction trx;
  trx.registerName = reg.name;
  trx.address = reg.address;
  trx.direction = pickDirection(reg);
  trx.dataRange = pickDataRange();
  trx.data = trx.isWrite() ? pickData(trx.dataRange, reg.getMaxValue()) : 0;

  LLVM_DEBUG(llvm::dbgs() << "generated " << trx << "\n");
  return trx;
}

//===----------------------------------------------------------------------===//
// TransactionSequence
//===----------------------------------------------------------------------===//

TransactionSequence::TransactionSequence(StimulusGenerator &generator,
                                         const RegisterModel &model,
                                         GoalPredicate isDone,
                                         CoveredProvider getCovered)
    : generator(generator), model(model), isDone(std::move(isDone)),
      getCovered(std::move(getCovered)) {}

llvm::Expected<std::optional<Transaction>> TransactionSequence::next() {
  if (isDone && isDone())
    return std::optional<Transaction>();

  llvm::StringSet<> covered;
  if (getCovered)
    covered = getCovered();

  auto trx = generator.next(model, covered);
  if (!trx)
    return trx.takeError();
  ++issued;
  return std::optional<Transaction>(std::move(*trx));
}
