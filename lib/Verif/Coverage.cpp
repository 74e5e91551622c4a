//===- Coverage.cpp - Functional coverage engine --------------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Verif/Coverage.h"
#include "spiv/Sim/SimulationControl.h"
#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/FormatVariadic.h"
#include <tuple>

#define DEBUG_TYPE "spiv-coverage"

using namespace spiv;
using namespace spiv::verif;

namespace {

/// Render a list of names as `[a, b, c]`.
std::string renderList(llvm::ArrayRef<std::string> names) {
  return "[" + llvm::join(names.begin(), names.end(), ", ") + "]";
}

std::string renderCounts(
    llvm::ArrayRef<std::pair<std::string, size_t>> counts) {
  std::string result;
  llvm::raw_string_ostream os(result);
  os << "{";
  llvm::interleaveComma(counts, os, [&](const auto &entry) {
    os << entry.first << ": " << entry.second;
  });
  os << "}";
  return os.str();
}

llvm::json::Array toJSONArray(llvm::ArrayRef<std::string> names) {
  llvm::json::Array array;
  for (const auto &name : names)
    array.push_back(name);
  return array;
}

} // namespace

//===----------------------------------------------------------------------===//
// CoverItem
//===----------------------------------------------------------------------===//

CoverItem::~CoverItem() = default;

std::optional<std::string> CoverItem::renderField(llvm::StringRef field,
                                                  llvm::StringRef dim) const {
  if (!dim.empty())
    return std::nullopt;
  if (field == "at_least")
    return std::to_string(getAtLeast());
  if (field == "weight")
    return std::to_string(getWeight());
  if (field == "size")
    return std::to_string(getSize());
  if (field == "coverage")
    return std::to_string(getCoverage());
  if (field == "cover_percentage")
    return llvm::formatv("{0:f2}", getCoverPercentage()).str();
  if (field == "new_hits")
    return renderList(getNewHits());
  if (field == "detailed_coverage")
    return renderCounts(getDetailedCoverage());
  return std::nullopt;
}

llvm::json::Value CoverItem::toJSON() const {
  llvm::json::Object bins;
  for (const auto &entry : getDetailedCoverage())
    bins[entry.first] = static_cast<int64_t>(entry.second);

  return llvm::json::Object{
      {"name", getName().str()},
      {"kind", getKind() == Kind::Point ? "point" : "cross"},
      {"at_least", static_cast<int64_t>(getAtLeast())},
      {"weight", static_cast<int64_t>(getWeight())},
      {"size", static_cast<int64_t>(getSize())},
      {"coverage", static_cast<int64_t>(getCoverage())},
      {"cover_percentage", getCoverPercentage()},
      {"detailed_coverage", std::move(bins)},
  };
}

//===----------------------------------------------------------------------===//
// CoverPoint
//===----------------------------------------------------------------------===//

CoverPoint::CoverPoint(llvm::StringRef name, std::vector<std::string> bins,
                       Relevance relevance, unsigned atLeast)
    : CoverItem(Kind::Point, name, atLeast), bins(std::move(bins)),
      relevance(std::move(relevance)) {
  hitCounts.assign(this->bins.size(), 0);
}

std::unique_ptr<CoverPoint>
CoverPoint::forField(llvm::StringRef name, llvm::StringRef field,
                     std::vector<std::string> bins, unsigned atLeast) {
  std::string fieldName = field.str();
  return std::make_unique<CoverPoint>(
      name, std::move(bins),
      [fieldName](const Transaction &trx, llvm::StringRef bin) {
        std::optional<std::string> value = trx.getField(fieldName);
        return value && *value == bin;
      },
      atLeast);
}

llvm::SmallVector<unsigned, 4>
CoverPoint::getRelevantBins(const Transaction &trx) const {
  llvm::SmallVector<unsigned, 4> result;
  if (!relevance)
    return result;
  for (unsigned i = 0, e = bins.size(); i != e; ++i)
    if (relevance(trx, bins[i]))
      result.push_back(i);
  return result;
}

void CoverPoint::sample(const Transaction &trx) {
  newHits = getRelevantBins(trx);
  for (unsigned bin : newHits) {
    if (++hitCounts[bin] == getAtLeast()) {
      coveredBins.push_back(bins[bin]);
      LLVM_DEBUG(llvm::dbgs() << getName() << ": covered " << bins[bin]
                              << "\n");
    }
  }
}

std::optional<unsigned> CoverPoint::getBinIndex(llvm::StringRef bin) const {
  for (unsigned i = 0, e = bins.size(); i != e; ++i)
    if (bins[i] == bin)
      return i;
  return std::nullopt;
}

size_t CoverPoint::getHitCount(llvm::StringRef bin) const {
  if (auto idx = getBinIndex(bin))
    return hitCounts[*idx];
  return 0;
}

bool CoverPoint::isCovered(llvm::StringRef bin) const {
  return getHitCount(bin) >= getAtLeast();
}

std::vector<std::string> CoverPoint::getNewHits() const {
  std::vector<std::string> result;
  for (unsigned bin : newHits)
    result.push_back(bins[bin]);
  return result;
}

std::vector<std::pair<std::string, size_t>>
CoverPoint::getDetailedCoverage() const {
  std::vector<std::pair<std::string, size_t>> result;
  for (unsigned i = 0, e = bins.size(); i != e; ++i)
    result.emplace_back(bins[i], hitCounts[i]);
  return result;
}

std::optional<std::string> CoverPoint::renderField(llvm::StringRef field,
                                                   llvm::StringRef dim) const {
  if (dim.empty() && field == "covered_bins")
    return renderList(coveredBins);
  return CoverItem::renderField(field, dim);
}

llvm::json::Value CoverPoint::toJSON() const {
  llvm::json::Value value = CoverItem::toJSON();
  (*value.getAsObject())["covered_bins"] = toJSONArray(coveredBins);
  return value;
}

//===----------------------------------------------------------------------===//
// CoverCross
//===----------------------------------------------------------------------===//

CoverCross::CoverCross(llvm::StringRef name,
                       llvm::ArrayRef<const CoverPoint *> dims,
                       IgnorePredicate ignore, unsigned atLeast)
    : CoverItem(Kind::Cross, name, atLeast), dims(dims.begin(), dims.end()) {
  binCounts.resize(dims.size());
  hasTuples.resize(dims.size());
  dimCoveredBins.resize(dims.size());
  for (unsigned d = 0, e = dims.size(); d != e; ++d) {
    binCounts[d].assign(dims[d]->getSize(), 0);
    hasTuples[d].assign(dims[d]->getSize(), false);
  }

  // Enumerate the cross product like an odometer.
  bool empty = dims.empty() || llvm::any_of(dims, [](const CoverPoint *dim) {
                 return dim->getSize() == 0;
               });
  IndexTuple current(dims.size(), 0);
  llvm::SmallVector<llvm::StringRef, 4> names(dims.size());
  bool done = empty;
  while (!done) {
    for (unsigned d = 0, e = dims.size(); d != e; ++d)
      names[d] = dims[d]->getBins()[current[d]];
    if (!ignore || !ignore(names)) {
      tupleIndex.emplace(current, tuples.size());
      tuples.push_back(current);
      for (unsigned d = 0, e = dims.size(); d != e; ++d) {
        ++binCounts[d][current[d]];
        hasTuples[d][current[d]] = true;
      }
    }

    done = true;
    for (unsigned d = dims.size(); d > 0; --d) {
      if (++current[d - 1] < dims[d - 1]->getSize()) {
        done = false;
        break;
      }
      current[d - 1] = 0;
    }
  }
  hitCounts.assign(tuples.size(), 0);
  LLVM_DEBUG(llvm::dbgs() << getName() << ": " << tuples.size()
                          << " tuples\n");
}

void CoverCross::sample(const Transaction &trx) {
  newHits.clear();
  if (tuples.empty())
    return;

  llvm::SmallVector<llvm::SmallVector<unsigned, 4>, 4> relevant;
  for (const CoverPoint *dim : dims) {
    relevant.push_back(dim->getRelevantBins(trx));
    if (relevant.back().empty())
      return;
  }

  // Walk the cross product of the relevant bins of every dimension.
  IndexTuple pos(dims.size(), 0);
  IndexTuple current(dims.size(), 0);
  bool done = false;
  while (!done) {
    for (unsigned d = 0, e = dims.size(); d != e; ++d)
      current[d] = relevant[d][pos[d]];

    auto it = tupleIndex.find(current);
    if (it != tupleIndex.end()) {
      size_t idx = it->second;
      newHits.push_back(idx);
      if (++hitCounts[idx] == getAtLeast()) {
        ++coveredTuples;
        for (unsigned d = 0, e = dims.size(); d != e; ++d) {
          if (--binCounts[d][current[d]] == 0) {
            const std::string &bin = dims[d]->getBins()[current[d]];
            dimCoveredBins[d].push_back(bin);
            LLVM_DEBUG(llvm::dbgs() << getName() << ": covered "
                                    << dims[d]->getName() << " bin " << bin
                                    << "\n");
          }
        }
      }
    }

    done = true;
    for (unsigned d = dims.size(); d > 0; --d) {
      if (++pos[d - 1] < relevant[d - 1].size()) {
        done = false;
        break;
      }
      pos[d - 1] = 0;
    }
  }
}

std::optional<unsigned> CoverCross::getDimIndex(llvm::StringRef dim) const {
  for (unsigned d = 0, e = dims.size(); d != e; ++d)
    if (dims[d]->getName() == dim)
      return d;
  return std::nullopt;
}

const CoverPoint *CoverCross::getDimension(llvm::StringRef name) const {
  if (auto d = getDimIndex(name))
    return dims[*d];
  return nullptr;
}

llvm::ArrayRef<std::string>
CoverCross::getCoveredBins(llvm::StringRef dim) const {
  if (auto d = getDimIndex(dim))
    return dimCoveredBins[*d];
  return {};
}

std::optional<size_t> CoverCross::getBinCount(llvm::StringRef dim,
                                              llvm::StringRef bin) const {
  auto d = getDimIndex(dim);
  if (!d)
    return std::nullopt;
  auto idx = dims[*d]->getBinIndex(bin);
  if (!idx || !hasTuples[*d][*idx])
    return std::nullopt;
  return binCounts[*d][*idx];
}

std::optional<size_t> CoverCross::getHitCount(BinTuple tuple) const {
  if (tuple.size() != dims.size())
    return std::nullopt;
  IndexTuple key;
  for (unsigned d = 0, e = dims.size(); d != e; ++d) {
    auto idx = dims[d]->getBinIndex(tuple[d]);
    if (!idx)
      return std::nullopt;
    key.push_back(*idx);
  }
  auto it = tupleIndex.find(key);
  if (it == tupleIndex.end())
    return std::nullopt;
  return hitCounts[it->second];
}

std::string CoverCross::getTupleName(const IndexTuple &tuple) const {
  std::string result = "(";
  for (unsigned d = 0, e = dims.size(); d != e; ++d) {
    if (d)
      result += ", ";
    result += dims[d]->getBins()[tuple[d]];
  }
  return result + ")";
}

std::vector<std::string> CoverCross::getNewHits() const {
  std::vector<std::string> result;
  for (size_t idx : newHits)
    result.push_back(getTupleName(tuples[idx]));
  return result;
}

std::vector<std::pair<std::string, size_t>>
CoverCross::getDetailedCoverage() const {
  std::vector<std::pair<std::string, size_t>> result;
  for (size_t i = 0, e = tuples.size(); i != e; ++i)
    result.emplace_back(getTupleName(tuples[i]), hitCounts[i]);
  return result;
}

std::optional<std::string> CoverCross::renderField(llvm::StringRef field,
                                                   llvm::StringRef dim) const {
  if (field != "covered_bins" && field != "bin_cnt")
    return CoverItem::renderField(field, dim);

  llvm::SmallVector<unsigned, 4> selected;
  if (dim.empty()) {
    for (unsigned d = 0, e = dims.size(); d != e; ++d)
      selected.push_back(d);
  } else if (auto d = getDimIndex(dim)) {
    selected.push_back(*d);
  } else {
    return std::nullopt;
  }

  std::string result;
  llvm::raw_string_ostream os(result);
  os << "{";
  llvm::interleaveComma(selected, os, [&](unsigned d) {
    os << dims[d]->getName() << ": ";
    if (field == "covered_bins") {
      os << renderList(dimCoveredBins[d]);
      return;
    }
    std::vector<std::pair<std::string, size_t>> counts;
    for (unsigned b = 0, be = dims[d]->getSize(); b != be; ++b)
      if (hasTuples[d][b])
        counts.emplace_back(dims[d]->getBins()[b], binCounts[d][b]);
    os << renderCounts(counts);
  });
  os << "}";
  return os.str();
}

llvm::json::Value CoverCross::toJSON() const {
  llvm::json::Value value = CoverItem::toJSON();
  llvm::json::Object &obj = *value.getAsObject();

  llvm::json::Array dimNames;
  llvm::json::Object covered;
  for (unsigned d = 0, e = dims.size(); d != e; ++d) {
    dimNames.push_back(dims[d]->getName().str());
    covered[dims[d]->getName().str()] = toJSONArray(dimCoveredBins[d]);
  }
  obj["dimensions"] = std::move(dimNames);
  obj["covered_bins"] = std::move(covered);
  return value;
}

//===----------------------------------------------------------------------===//
// CoverageEngine
//===----------------------------------------------------------------------===//

llvm::Error CoverageEngine::addItem(std::unique_ptr<CoverItem> item) {
  if (!item)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "null coverage item");
  if (byName.count(item->getName()))
    return llvm::createStringError(std::errc::file_exists,
                                   "duplicate coverage item '%s'",
                                   item->getName().str().c_str());
  byName[item->getName()] = item.get();
  items.push_back(std::move(item));
  return llvm::Error::success();
}

CoverItem *CoverageEngine::lookup(llvm::StringRef name) const {
  auto it = byName.find(name);
  return it == byName.end() ? nullptr : it->second;
}

void CoverageEngine::sample(const Transaction &trx) {
  ++samples;
  for (auto &item : items)
    item->sample(trx);

  if (!control)
    return;
  for (const auto &line : getStatusLines())
    control->info("COVERAGE", line);
}

void CoverageEngine::setStatusReport(llvm::StringRef item,
                                     llvm::ArrayRef<std::string> fields) {
  CoverItem *cov = lookup(item);
  if (!cov) {
    if (control)
      control->warning(
          "COVERAGE_CFG",
          llvm::formatv("unknown coverage item '{0}' in status report", item)
              .str());
    return;
  }

  std::vector<std::string> kept;
  for (const auto &field : fields) {
    llvm::StringRef name, dim;
    std::tie(name, dim) = llvm::StringRef(field).split(':');
    if (!cov->renderField(name, dim)) {
      if (control)
        control->warning("COVERAGE_CFG",
                         llvm::formatv("unknown status field '{0}' of '{1}'",
                                       field, item)
                             .str());
      continue;
    }
    kept.push_back(field);
  }
  if (kept.empty())
    return;

  for (auto &entry : statusFields) {
    if (entry.first == item) {
      entry.second = std::move(kept);
      return;
    }
  }
  statusFields.emplace_back(item.str(), std::move(kept));
}

std::vector<std::string> CoverageEngine::getStatusLines() const {
  std::vector<std::string> lines;
  for (const auto &entry : statusFields) {
    CoverItem *item = lookup(entry.first);
    if (!item)
      continue;
    std::string line = entry.first + ":";
    for (const auto &field : entry.second) {
      llvm::StringRef name, dim;
      std::tie(name, dim) = llvm::StringRef(field).split(':');
      if (auto value = item->renderField(name, dim))
        line += " " + field + "=" + *value;
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

double CoverageEngine::getTotalCoverPercentage() const {
  double weighted = 0;
  uint64_t totalWeight = 0;
  for (const auto &item : items) {
    weighted += item->getWeight() * item->getCoverPercentage();
    totalWeight += item->getWeight();
  }
  return totalWeight ? weighted / totalWeight : 100.0;
}

void CoverageEngine::printReport(llvm::raw_ostream &os, bool withBins) const {
  os << "Coverage report (" << samples << " samples)\n";
  for (const auto &item : items) {
    os << "  " << item->getName() << ": "
       << llvm::format("%.2f", item->getCoverPercentage()) << "% ("
       << item->getCoverage() << "/" << item->getSize() << ", at_least "
       << item->getAtLeast() << ")\n";
    if (!withBins)
      continue;
    for (const auto &entry : item->getDetailedCoverage())
      os << "    " << entry.first << ": " << entry.second << "\n";
  }
  os << "  total: " << llvm::format("%.2f", getTotalCoverPercentage())
     << "% (weighted)\n";
}

llvm::json::Value CoverageEngine::toJSON() const {
  llvm::json::Array array;
  for (const auto &item : items)
    array.push_back(item->toJSON());
  return llvm::json::Object{{"samples", static_cast<int64_t>(samples)},
                            {"total", getTotalCoverPercentage()},
                            {"items", std::move(array)}};
}
