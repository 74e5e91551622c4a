//===- Scoreboard.cpp - Expected versus observed transactions -------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Verif/Scoreboard.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/Format.h"
#include "llvm/Support/FormatVariadic.h"

#define DEBUG_TYPE "spiv-scoreboard"

using namespace spiv;
using namespace spiv::verif;

namespace {
template <typename T>
std::string render(const T &value) {
  std::string result;
  llvm::raw_string_ostream os(result);
  os << value;
  return os.str();
}
} // namespace

std::optional<ScoreboardMode>
spiv::verif::parseScoreboardMode(llvm::StringRef str) {
  if (str == "fail_immediately")
    return ScoreboardMode::FailImmediately;
  if (str == "accumulate")
    return ScoreboardMode::Accumulate;
  return std::nullopt;
}

llvm::raw_ostream &spiv::verif::operator<<(llvm::raw_ostream &os,
                                           const Expectation &exp) {
  os << getDirectionName(exp.direction) << " @"
     << llvm::format_hex(exp.address, 4) << " data=";
  if (exp.data)
    os << llvm::format_hex(*exp.data, 6);
  else
    os << "*";
  return os;
}

//===----------------------------------------------------------------------===//
// Scoreboard
//===----------------------------------------------------------------------===//

Scoreboard::Scoreboard(sim::SimulationControl &control, ScoreboardMode mode)
    : control(control), mode(mode) {}

bool Scoreboard::defaultCompare(const Expectation &exp,
                                const Observation &obs) {
  if (exp.direction != obs.direction || exp.address != obs.address)
    return false;
  return !exp.data || *exp.data == obs.data;
}

llvm::Error Scoreboard::addChannel(llvm::StringRef name, CompareFn compare) {
  if (channels.count(name))
    return llvm::createStringError(std::errc::file_exists,
                                   "duplicate scoreboard channel '%s'",
                                   name.str().c_str());
  Channel &channel = channels[name];
  channel.compare = compare ? std::move(compare) : CompareFn(defaultCompare);
  return llvm::Error::success();
}

llvm::Error Scoreboard::expect(llvm::StringRef channel,
                               const Expectation &exp) {
  auto it = channels.find(channel);
  if (it == channels.end())
    return llvm::createStringError(std::errc::invalid_argument,
                                   "unknown scoreboard channel '%s'",
                                   channel.str().c_str());
  LLVM_DEBUG(llvm::dbgs() << channel << ": expect " << exp << "\n");
  it->second.queue.push_back(exp);
  return llvm::Error::success();
}

void Scoreboard::reportMismatch(Mismatch mismatch,
                                const llvm::Twine &message) {
  mismatch.time = control.getCurrentTime();
  mismatches.push_back(std::move(mismatch));
  if (mode == ScoreboardMode::FailImmediately)
    control.fatal("SCOREBOARD", message.str());
  else
    control.error("SCOREBOARD", message.str());
}

bool Scoreboard::observe(llvm::StringRef channel, const Observation &obs) {
  std::string obsText = render(obs);

  auto it = channels.find(channel);
  if (it == channels.end() || it->second.queue.empty()) {
    Mismatch mismatch;
    mismatch.channel = channel.str();
    mismatch.observed = obs;
    reportMismatch(std::move(mismatch),
                   llvm::formatv("{0}: unexpected observation {1}", channel,
                                 obsText));
    return false;
  }

  Channel &chan = it->second;
  Expectation exp = chan.queue.front();
  chan.queue.pop_front();
  if (chan.compare(exp, obs)) {
    ++matches;
    LLVM_DEBUG(llvm::dbgs() << channel << ": match " << obs << "\n");
    return true;
  }

  std::string expText = render(exp);
  Mismatch mismatch;
  mismatch.channel = channel.str();
  mismatch.expected = exp;
  mismatch.observed = obs;
  reportMismatch(std::move(mismatch),
                 llvm::formatv("{0}: expected {1}, observed {2}", channel,
                               expText, obsText));
  return false;
}

void Scoreboard::finalize() {
  if (finalized)
    return;
  finalized = true;
  for (auto &entry : channels) {
    for (const Expectation &exp : entry.second.queue) {
      std::string expText = render(exp);
      Mismatch mismatch;
      mismatch.channel = entry.first().str();
      mismatch.expected = exp;
      // The run is over; these are collected, never fatal.
      mismatch.time = control.getCurrentTime();
      mismatches.push_back(std::move(mismatch));
      control.error("SCOREBOARD",
                    llvm::formatv("{0}: expected {1} was never observed",
                                  entry.first(), expText)
                        .str());
    }
    entry.second.queue.clear();
  }
}

llvm::Error Scoreboard::getResult() const {
  if (mismatches.empty())
    return llvm::Error::success();
  return llvm::createStringError(
      std::errc::protocol_error, "scoreboard: %zu mismatch(es), %zu match(es)",
      mismatches.size(), matches);
}

size_t Scoreboard::getPendingCount(llvm::StringRef channel) const {
  auto it = channels.find(channel);
  return it == channels.end() ? 0 : it->second.queue.size();
}

//===----------------------------------------------------------------------===//
// ResetDetector
//===----------------------------------------------------------------------===//

bool ResetDetector::check(const Transaction &trx, RegisterModel &model) {
  if (!isReset(trx))
    return false;
  model.clearWrittenValues();
  ++detected;
  LLVM_DEBUG(llvm::dbgs() << "reset command detected: " << trx << "\n");
  return true;
}
