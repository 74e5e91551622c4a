//===- StimulusGenerator.h - Constrained-random transactions ----*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the constrained-random transaction generator and the
// pull-based sequence the test bench draws transactions from.
//
// Fields are solved in a fixed order: register, direction, data range. Each
// domain is small, so it is enumerated, filtered by the hard constraints and
// weight-sampled.
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_VERIF_STIMULUSGENERATOR_H
#define SPIV_VERIF_STIMULUSGENERATOR_H

#include "spiv/Verif/RegisterModel.h"
#include "spiv/Verif/Transaction.h"
#include "llvm/ADT/StringSet.h"
#include "llvm/Support/Error.h"
#include <functional>
#include <optional>
#include <random>

namespace spiv {
namespace verif {

/// Soft constraint on the register choice.
struct StimulusWeights {
  /// Weight of a register already covered by the goal cross.
  unsigned coveredWeight = 1;
  /// Weight of any other register.
  unsigned uncoveredWeight = 8;
};

class StimulusGenerator {
public:
  explicit StimulusGenerator(std::mt19937 &rng,
                             const StimulusWeights &weights = StimulusWeights());

  /// Produce the next transaction. `covered` holds the names of registers
  /// the coverage goal no longer needs. Fails on an empty model.
  llvm::Expected<Transaction> next(const RegisterModel &model,
                                   const llvm::StringSet<> &covered);

  /// The write data for `range` in a register whose largest value is
  /// `maxValue`.
  uint32_t pickData(DataRange range, uint32_t maxValue);

  /// Weight of a data range class.
  static unsigned getDataRangeWeight(DataRange range);

  const StimulusWeights &getWeights() const { return weights; }

private:
  const RegisterEntry &pickRegister(const RegisterModel &model,
                                    const llvm::StringSet<> &covered);
  Direction pickDirection(const RegisterEntry &reg);
  DataRange pickDataRange();

  std::mt19937 &rng;
  StimulusWeights weights;
};

/// Pulls transactions from a generator until the goal is reached.
class TransactionSequence {
public:
  using GoalPredicate = std::function<bool()>;
  using CoveredProvider = std::function<llvm::StringSet<>()>;

  TransactionSequence(StimulusGenerator &generator, const RegisterModel &model,
                      GoalPredicate isDone, CoveredProvider getCovered);

  /// The next transaction, or nullopt once the goal predicate holds.
  llvm::Expected<std::optional<Transaction>> next();

  size_t getIssuedCount() const { return issued; }

private:
  StimulusGenerator &generator;
  const RegisterModel &model;
  GoalPredicate isDone;
  CoveredProvider getCovered;
  size_t issued = 0;
};

} // namespace verif
} // namespace spiv

#endif // SPIV_VERIF_STIMULUSGENERATOR_H
