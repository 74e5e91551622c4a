//===- SimulationControl.h - Run control and diagnostics --------*- C++ -*-===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//
//
// This file defines the run control of a verification run:
// - finish and abort handling
// - fatal and timeout termination
// - message reporting with severities, IDs and counts
//
//===----------------------------------------------------------------------===//

#ifndef SPIV_SIM_SIMULATIONCONTROL_H
#define SPIV_SIM_SIMULATIONCONTROL_H

#include "spiv/Sim/EventQueue.h"
#include "llvm/ADT/StringRef.h"
#include "llvm/Support/raw_ostream.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace spiv {
namespace sim {

//===----------------------------------------------------------------------===//
// SimulationStatus - Run completion status
//===----------------------------------------------------------------------===//

enum class SimulationStatus : uint8_t {
  /// The run is still going.
  Running = 0,

  /// The run finished normally.
  Finished = 1,

  /// The run was terminated by a timeout.
  Timeout = 2,

  /// The run was terminated by a fatal message.
  Fatal = 3,

  /// The run was aborted from outside.
  Aborted = 4
};

inline const char *getSimulationStatusName(SimulationStatus status) {
  switch (status) {
  case SimulationStatus::Running:
    return "running";
  case SimulationStatus::Finished:
    return "finished";
  case SimulationStatus::Timeout:
    return "timeout";
  case SimulationStatus::Fatal:
    return "fatal";
  case SimulationStatus::Aborted:
    return "aborted";
  }
  return "unknown";
}

//===----------------------------------------------------------------------===//
// MessageSeverity - Severity levels for diagnostic messages
//===----------------------------------------------------------------------===//

enum class MessageSeverity : uint8_t {
  Info = 0,
  Warning = 1,
  Error = 2,
  /// Terminates the run.
  Fatal = 3
};

inline const char *getMessageSeverityName(MessageSeverity severity) {
  switch (severity) {
  case MessageSeverity::Info:
    return "INFO";
  case MessageSeverity::Warning:
    return "WARNING";
  case MessageSeverity::Error:
    return "ERROR";
  case MessageSeverity::Fatal:
    return "FATAL";
  }
  return "UNKNOWN";
}

/// A diagnostic message of the run.
struct SimulationMessage {
  MessageSeverity severity;
  std::string id;
  std::string text;
  SimTime time;

  SimulationMessage(MessageSeverity sev, llvm::StringRef id,
                    llvm::StringRef text, SimTime time = SimTime())
      : severity(sev), id(id.str()), text(text.str()), time(time) {}
};

//===----------------------------------------------------------------------===//
// SimulationControl - Main run control class
//===----------------------------------------------------------------------===//

/// Run status plus the message channel every component reports through.
/// Messages are printed as `[<time>ns] SEVERITY(ID): text`.
class SimulationControl {
public:
  struct Config {
    /// INFO messages above this level are counted but not printed.
    int verbosity;

    /// Whether to prefix messages with the simulation time.
    bool showTime;

    /// Maximum number of messages kept in the history (0 = unlimited).
    size_t maxHistorySize;

    /// Output stream for messages.
    llvm::raw_ostream *messageOutput;

    Config()
        : verbosity(1), showTime(true), maxHistorySize(1000),
          messageOutput(&llvm::errs()) {}
  };

  SimulationControl(Config config = Config());
  ~SimulationControl();

  //===--------------------------------------------------------------------===//
  // Run Control
  //===--------------------------------------------------------------------===//

  /// Finish the run normally. Ignored once the run has ended.
  void finish(int exitCode = 0);

  /// Abort the run.
  void abort();

  /// Terminate the run with a fatal WATCHDOG message and status timeout.
  void timeout(llvm::StringRef message);

  SimulationStatus getStatus() const { return status; }
  bool shouldContinue() const { return status == SimulationStatus::Running; }
  int getExitCode() const { return exitCode; }

  //===--------------------------------------------------------------------===//
  // Message Reporting
  //===--------------------------------------------------------------------===//

  /// Report an informational message, printed when `verbosity` does not
  /// exceed the configured level.
  void info(llvm::StringRef id, llvm::StringRef message, int verbosity = 1);
  void warning(llvm::StringRef id, llvm::StringRef message);
  void error(llvm::StringRef id, llvm::StringRef message);

  /// Report a fatal message. The run ends with status fatal.
  void fatal(llvm::StringRef id, llvm::StringRef message);

  void report(MessageSeverity severity, llvm::StringRef id,
              llvm::StringRef message);

  const std::vector<SimulationMessage> &getMessageHistory() const {
    return messageHistory;
  }

  /// The most recent message of the given severity, if any.
  std::optional<SimulationMessage>
  getLastMessage(MessageSeverity severity) const;

  size_t getErrorCount() const { return errorCount; }
  size_t getWarningCount() const { return warningCount; }
  size_t getInfoCount() const { return infoCount; }
  size_t getFatalCount() const { return fatalCount; }

  //===--------------------------------------------------------------------===//
  // Configuration
  //===--------------------------------------------------------------------===//

  void setVerbosity(int level) { config.verbosity = level; }
  int getVerbosity() const { return config.verbosity; }
  bool shouldDisplay(int messageVerbosity) const {
    return messageVerbosity <= config.verbosity;
  }

  void setOutputStream(llvm::raw_ostream &os) { config.messageOutput = &os; }
  llvm::raw_ostream &getOutputStream() { return *config.messageOutput; }
  void setShowTime(bool show) { config.showTime = show; }

  /// Set where message timestamps come from.
  void setTimeSource(std::function<SimTime()> source) {
    timeSource = std::move(source);
  }
  SimTime getCurrentTime() const {
    return timeSource ? timeSource() : SimTime();
  }

  /// Called whenever the run leaves the running state.
  void setFinishCallback(std::function<void(SimulationStatus)> callback) {
    finishCallback = std::move(callback);
  }

private:
  void outputMessage(const SimulationMessage &message);
  void endRun(SimulationStatus newStatus, int code);

  Config config;
  SimulationStatus status = SimulationStatus::Running;
  int exitCode = 0;
  bool timingOut = false;

  size_t errorCount = 0;
  size_t warningCount = 0;
  size_t infoCount = 0;
  size_t fatalCount = 0;

  std::vector<SimulationMessage> messageHistory;
  std::function<SimTime()> timeSource;
  std::function<void(SimulationStatus)> finishCallback;
};

} // namespace sim
} // namespace spiv

#endif // SPIV_SIM_SIMULATIONCONTROL_H
