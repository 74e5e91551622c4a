//===- Coverage.h - Functional coverage engine ------------------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the functional coverage items sampled with every
// transaction: cover points over a set of named bins, and crosses over the
// bins of several points. Crosses track, per dimension, how many of the
// tuples containing a bin are still uncovered, so that a bin of a dimension
// is reported covered once all its tuples are.
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_VERIF_COVERAGE_H
#define SPIV_VERIF_COVERAGE_H

#include "spiv/Verif/Transaction.h"
#include "llvm/ADT/ArrayRef.h"
#include "llvm/ADT/SmallVector.h"
#include "llvm/ADT/StringMap.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/Casting.h"
#include "llvm/Support/Error.h"
#include "llvm/Support/JSON.h"
#include "llvm/Support/raw_ostream.h"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace spiv {
namespace sim {
class SimulationControl;
} // namespace sim

namespace verif {

//===----------------------------------------------------------------------===//
// CoverItem
//===----------------------------------------------------------------------===//

/// Base class of the coverage items.
class CoverItem {
public:
  enum class Kind { Point, Cross };

  CoverItem(Kind kind, llvm::StringRef name, unsigned atLeast)
      : kind(kind), name(name.str()), atLeast(atLeast ? atLeast : 1) {}
  virtual ~CoverItem();

  Kind getKind() const { return kind; }
  llvm::StringRef getName() const { return name; }

  /// Hits a bin needs to count as covered.
  unsigned getAtLeast() const { return atLeast; }

  /// Share of the item in the weighted total. Zero leaves it out.
  unsigned getWeight() const { return weight; }
  void setWeight(unsigned newWeight) { weight = newWeight; }

  virtual void sample(const Transaction &trx) = 0;

  /// Number of bins.
  virtual size_t getSize() const = 0;

  /// Number of covered bins.
  virtual size_t getCoverage() const = 0;

  /// Covered bins as a percentage of all bins. 100 for an empty item.
  double getCoverPercentage() const {
    size_t size = getSize();
    return size ? 100.0 * getCoverage() / size : 100.0;
  }

  /// Names of the bins hit by the latest sample.
  virtual std::vector<std::string> getNewHits() const = 0;

  /// Hit count per bin name.
  virtual std::vector<std::pair<std::string, size_t>>
  getDetailedCoverage() const = 0;

  /// Render a status report field, or nullopt for a field this item does
  /// not have. `dim` selects the dimension of a cross for the per-dimension
  /// fields.
  virtual std::optional<std::string>
  renderField(llvm::StringRef field, llvm::StringRef dim = "") const;

  virtual llvm::json::Value toJSON() const;

private:
  Kind kind;
  std::string name;
  unsigned atLeast;
  unsigned weight = 1;
};

//===----------------------------------------------------------------------===//
// CoverPoint
//===----------------------------------------------------------------------===//

class CoverPoint : public CoverItem {
public:
  /// Decides whether a transaction hits a bin.
  using Relevance =
      std::function<bool(const Transaction &trx, llvm::StringRef bin)>;

  CoverPoint(llvm::StringRef name, std::vector<std::string> bins,
             Relevance relevance, unsigned atLeast = 1);

  /// A point whose bin is hit when the transaction field `field` renders
  /// as the bin name.
  static std::unique_ptr<CoverPoint> forField(llvm::StringRef name,
                                              llvm::StringRef field,
                                              std::vector<std::string> bins,
                                              unsigned atLeast = 1);

  void sample(const Transaction &trx) override;

  /// Indices of the bins `trx` is relevant to. Does not record anything.
  llvm::SmallVector<unsigned, 4> getRelevantBins(const Transaction &trx) const;

  llvm::ArrayRef<std::string> getBins() const { return bins; }
  std::optional<unsigned> getBinIndex(llvm::StringRef bin) const;
  size_t getHitCount(llvm::StringRef bin) const;
  bool isCovered(llvm::StringRef bin) const;

  /// Covered bins in the order they became covered.
  llvm::ArrayRef<std::string> getCoveredBins() const { return coveredBins; }

  size_t getSize() const override { return bins.size(); }
  size_t getCoverage() const override { return coveredBins.size(); }
  std::vector<std::string> getNewHits() const override;
  std::vector<std::pair<std::string, size_t>>
  getDetailedCoverage() const override;

  std::optional<std::string> renderField(llvm::StringRef field,
                                         llvm::StringRef dim) const override;
  llvm::json::Value toJSON() const override;

  static bool classof(const CoverItem *item) {
    return item->getKind() == Kind::Point;
  }

private:
  std::vector<std::string> bins;
  Relevance relevance;
  std::vector<size_t> hitCounts;
  std::vector<std::string> coveredBins;
  llvm::SmallVector<unsigned, 4> newHits;
};

//===----------------------------------------------------------------------===//
// CoverCross
//===----------------------------------------------------------------------===//

class CoverCross : public CoverItem {
public:
  /// Bin names of a cross tuple, one per dimension.
  using BinTuple = llvm::ArrayRef<llvm::StringRef>;

  /// Returns true for tuples excluded from the cross.
  using IgnorePredicate = std::function<bool(BinTuple tuple)>;

  /// Enumerates the tuples of the cross and tallies, per dimension, the
  /// number of tuples each bin takes part in. The dimensions must outlive
  /// the cross.
  CoverCross(llvm::StringRef name, llvm::ArrayRef<const CoverPoint *> dims,
             IgnorePredicate ignore = nullptr, unsigned atLeast = 1);

  void sample(const Transaction &trx) override;

  llvm::ArrayRef<const CoverPoint *> getDimensions() const { return dims; }
  const CoverPoint *getDimension(llvm::StringRef name) const;

  /// Bins of dimension `dim` all of whose tuples are covered, in the order
  /// they became covered.
  llvm::ArrayRef<std::string> getCoveredBins(llvm::StringRef dim) const;

  /// Uncovered tuples containing `bin` of dimension `dim`. nullopt when the
  /// bin takes part in no tuple.
  std::optional<size_t> getBinCount(llvm::StringRef dim,
                                    llvm::StringRef bin) const;

  /// Hit count of a tuple. nullopt for an ignored or unknown tuple.
  std::optional<size_t> getHitCount(BinTuple tuple) const;

  size_t getSize() const override { return tuples.size(); }
  size_t getCoverage() const override { return coveredTuples; }
  std::vector<std::string> getNewHits() const override;
  std::vector<std::pair<std::string, size_t>>
  getDetailedCoverage() const override;

  std::optional<std::string> renderField(llvm::StringRef field,
                                         llvm::StringRef dim) const override;
  llvm::json::Value toJSON() const override;

  static bool classof(const CoverItem *item) {
    return item->getKind() == Kind::Cross;
  }

private:
  using IndexTuple = std::vector<unsigned>;

  std::optional<unsigned> getDimIndex(llvm::StringRef dim) const;
  std::string getTupleName(const IndexTuple &tuple) const;

  llvm::SmallVector<const CoverPoint *, 4> dims;
  std::vector<IndexTuple> tuples;
  std::map<IndexTuple, size_t> tupleIndex;
  std::vector<size_t> hitCounts;
  size_t coveredTuples = 0;
  std::vector<size_t> newHits;

  /// Per dimension, per bin: uncovered tuples containing the bin.
  std::vector<std::vector<size_t>> binCounts;
  /// Per dimension, per bin: whether the bin takes part in any tuple.
  std::vector<std::vector<bool>> hasTuples;
  /// Per dimension: bins whose tuples are all covered.
  std::vector<std::vector<std::string>> dimCoveredBins;
};

//===----------------------------------------------------------------------===//
// CoverageEngine
//===----------------------------------------------------------------------===//

/// Registry of coverage items. Items are sampled in registration order.
class CoverageEngine {
public:
  CoverageEngine() = default;

  /// Register an item. Fails on a duplicate name.
  llvm::Error addItem(std::unique_ptr<CoverItem> item);

  CoverItem *lookup(llvm::StringRef name) const;
  const CoverPoint *lookupPoint(llvm::StringRef name) const {
    return llvm::dyn_cast_or_null<CoverPoint>(lookup(name));
  }
  const CoverCross *lookupCross(llvm::StringRef name) const {
    return llvm::dyn_cast_or_null<CoverCross>(lookup(name));
  }

  llvm::ArrayRef<std::unique_ptr<CoverItem>> getItems() const {
    return items;
  }

  /// Sample every item, then report the configured status lines.
  void sample(const Transaction &trx);

  size_t getSampleCount() const { return samples; }

  /// Cover percentages of all items averaged by weight. 100 when no item
  /// carries weight.
  double getTotalCoverPercentage() const;

  /// Send status lines and warnings to `control`.
  void setControl(sim::SimulationControl *control) { this->control = control; }

  /// Select the fields reported for `item` after every sample. Unknown
  /// items and fields are dropped with a warning.
  void setStatusReport(llvm::StringRef item,
                       llvm::ArrayRef<std::string> fields);

  /// Status line of every configured item, `<item>: field=value ...`.
  std::vector<std::string> getStatusLines() const;

  /// Print every item; with `withBins` also its per-bin hit counts.
  void printReport(llvm::raw_ostream &os, bool withBins) const;

  /// The whole coverage database as JSON.
  llvm::json::Value toJSON() const;

private:
  std::vector<std::unique_ptr<CoverItem>> items;
  llvm::StringMap<CoverItem *> byName;
  std::vector<std::pair<std::string, std::vector<std::string>>> statusFields;
  sim::SimulationControl *control = nullptr;
  size_t samples = 0;
};

} // namespace verif
} // namespace spiv

#endif // SPIV_VERIF_COVERAGE_H
