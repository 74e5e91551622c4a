//===- SimulationControl.cpp - Run control and diagnostics ----------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file implements the run control and the message channel of a
// verification run.
//
//===----------------------------------------------------------------------===//

#include "spiv/Sim/SimulationControl.h"
#include "llvm/Support/Debug.h"
#include "llvm/Support/Format.h"

#define DEBUG_TYPE "spiv-simulation-control"

using namespace spiv;
using namespace spiv::sim;

SimulationControl::SimulationControl(Config config)
    : config(std::move(config)) {}

SimulationControl::~SimulationControl() = default;

//===----------------------------------------------------------------------===//
// Run Control
//===----------------------------------------------------------------------===//

void SimulationControl::endRun(SimulationStatus newStatus, int code) {
  status = newStatus;
  exitCode = code;
  LLVM_DEBUG(llvm::dbgs() << "SimulationControl: run ended with status "
                          << getSimulationStatusName(newStatus) << "\n");
  if (finishCallback)
    finishCallback(newStatus);
}

void SimulationControl::finish(int code) {
  if (status != SimulationStatus::Running)
    return;
  endRun(SimulationStatus::Finished, code);
}

void SimulationControl::abort() {
  if (status != SimulationStatus::Running)
    return;
  endRun(SimulationStatus::Aborted, 1);
}

void SimulationControl::timeout(llvm::StringRef message) {
  if (status != SimulationStatus::Running)
    return;
  // Reported as fatal, but the status records why the run ended.
  timingOut = true;
  report(MessageSeverity::Fatal, "WATCHDOG", message);
  timingOut = false;
}

//===----------------------------------------------------------------------===//
// Message Reporting
//===----------------------------------------------------------------------===//

void SimulationControl::info(llvm::StringRef id, llvm::StringRef message,
                             int verbosity) {
  if (!shouldDisplay(verbosity)) {
    ++infoCount;
    return;
  }
  report(MessageSeverity::Info, id, message);
}

void SimulationControl::warning(llvm::StringRef id, llvm::StringRef message) {
  report(MessageSeverity::Warning, id, message);
}

void SimulationControl::error(llvm::StringRef id, llvm::StringRef message) {
  report(MessageSeverity::Error, id, message);
}

void SimulationControl::fatal(llvm::StringRef id, llvm::StringRef message) {
  report(MessageSeverity::Fatal, id, message);
}

void SimulationControl::report(MessageSeverity severity, llvm::StringRef id,
                               llvm::StringRef message) {
  SimulationMessage msg(severity, id, message, getCurrentTime());

  switch (severity) {
  case MessageSeverity::Info:
    ++infoCount;
    break;
  case MessageSeverity::Warning:
    ++warningCount;
    break;
  case MessageSeverity::Error:
    ++errorCount;
    break;
  case MessageSeverity::Fatal:
    ++errorCount;
    ++fatalCount;
    break;
  }

  outputMessage(msg);

  if (config.maxHistorySize > 0 &&
      messageHistory.size() >= config.maxHistorySize)
    messageHistory.erase(messageHistory.begin());
  messageHistory.push_back(msg);

  if (severity == MessageSeverity::Fatal &&
      status == SimulationStatus::Running)
    endRun(timingOut ? SimulationStatus::Timeout : SimulationStatus::Fatal, 1);
}

std::optional<SimulationMessage>
SimulationControl::getLastMessage(MessageSeverity severity) const {
  for (auto it = messageHistory.rbegin(); it != messageHistory.rend(); ++it)
    if (it->severity == severity)
      return *it;
  return std::nullopt;
}

void SimulationControl::outputMessage(const SimulationMessage &message) {
  if (!config.messageOutput)
    return;
  llvm::raw_ostream &os = *config.messageOutput;

  // Format: [TIME] SEVERITY(ID): message
  if (config.showTime)
    os << "[" << llvm::format("%.1f", message.time.getNanoseconds())
       << "ns] ";
  os << getMessageSeverityName(message.severity) << "(" << message.id
     << "): " << message.text << "\n";
}
