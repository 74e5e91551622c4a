//===- RunConfig.cpp - Verification run configuration ---------------------===//
//
// Part of the LLVM Project, under the Apache License v2.0 with LLVM Exceptions.
// See https://llvm.org/LICENSE.txt for license information.
// SPDX-License-Identifier: Apache-2.0 WITH LLVM-exception
//
//===----------------------------------------------------------------------===//

#include "spiv/Support/RunConfig.h"

#include "llvm/ADT/STLExtras.h"
#include "llvm/ADT/SmallString.h"
#include "llvm/ADT/StringExtras.h"
#include "llvm/Support/FileSystem.h"
#include "llvm/Support/MemoryBuffer.h"
#include "llvm/Support/Path.h"
#include "llvm/Support/SourceMgr.h"
#include "llvm/Support/YAMLParser.h"

#include <functional>
#include <limits>

using namespace spiv;

//===----------------------------------------------------------------------===//
// YAML Parsing Helpers
//===----------------------------------------------------------------------===//

namespace {

/// Get scalar value from a YAML node.
llvm::StringRef getScalar(llvm::yaml::Node *node,
                          llvm::SmallVectorImpl<char> &storage) {
  if (auto *scalar = llvm::dyn_cast<llvm::yaml::ScalarNode>(node))
    return scalar->getValue(storage);
  return "";
}

/// Get boolean value from a YAML node.
bool getBool(llvm::yaml::Node *node) {
  llvm::SmallString<16> storage;
  auto val = getScalar(node, storage);
  return val == "true" || val == "yes" || val == "1" || val == "on";
}

/// Parse a string sequence from a YAML node.
void parseStringSequence(llvm::yaml::Node *node,
                         std::vector<std::string> &out) {
  if (auto *seq = llvm::dyn_cast<llvm::yaml::SequenceNode>(node)) {
    for (auto &item : *seq) {
      llvm::SmallString<128> storage;
      auto val = getScalar(&item, storage);
      if (!val.empty())
        out.push_back(val.str());
    }
  }
}

/// Parse a YAML mapping node with a callback for each key-value pair.
bool parseMapping(llvm::yaml::MappingNode *mapping,
                  std::function<bool(llvm::StringRef, llvm::yaml::Node *)> cb) {
  for (auto &entry : *mapping) {
    auto *keyNode = llvm::dyn_cast<llvm::yaml::ScalarNode>(entry.getKey());
    if (!keyNode)
      continue;

    llvm::SmallString<64> keyStorage;
    llvm::StringRef key = keyNode->getValue(keyStorage);

    if (!cb(key, entry.getValue()))
      return false;
  }
  return true;
}

/// Collects the first problem found while walking the document.
class ConfigParser {
public:
  explicit ConfigParser(RunConfig &config) : config(config) {}

  bool parseRoot(llvm::yaml::MappingNode *root);

  const std::string &getProblem() const { return problem; }

private:
  template <typename T>
  bool parseInteger(llvm::StringRef key, llvm::yaml::Node *node, T &out);
  bool parseDouble(llvm::StringRef key, llvm::yaml::Node *node, double &out);
  bool parseString(llvm::StringRef key, llvm::yaml::Node *node,
                   std::string &out);
  llvm::yaml::MappingNode *getMapping(llvm::StringRef key,
                                      llvm::yaml::Node *node);

  bool parseReset(llvm::yaml::MappingNode *node);
  bool parseStimulus(llvm::yaml::MappingNode *node);
  bool parsePulse(llvm::yaml::MappingNode *node);
  bool parseCoverage(llvm::yaml::MappingNode *node);
  bool parseTimeouts(llvm::yaml::MappingNode *node);

  bool fail(const llvm::Twine &message) {
    problem = message.str();
    return false;
  }

  RunConfig &config;
  std::string problem;
};

template <typename T>
bool ConfigParser::parseInteger(llvm::StringRef key, llvm::yaml::Node *node,
                                T &out) {
  llvm::SmallString<32> storage;
  llvm::StringRef text = getScalar(node, storage).trim();
  uint64_t value;
  // Radix 0 accepts 0x, 0o and 0b prefixes.
  if (text.getAsInteger(0, value) ||
      value > static_cast<uint64_t>(std::numeric_limits<T>::max()))
    return fail("invalid integer value '" + text + "' for '" + key + "'");
  out = static_cast<T>(value);
  return true;
}

bool ConfigParser::parseDouble(llvm::StringRef key, llvm::yaml::Node *node,
                               double &out) {
  llvm::SmallString<32> storage;
  llvm::StringRef text = getScalar(node, storage).trim();
  if (text.getAsDouble(out))
    return fail("invalid number '" + text + "' for '" + key + "'");
  return true;
}

bool ConfigParser::parseString(llvm::StringRef key, llvm::yaml::Node *node,
                               std::string &out) {
  if (!llvm::isa<llvm::yaml::ScalarNode>(node))
    return fail("'" + key + "' must be a scalar");
  llvm::SmallString<128> storage;
  out = getScalar(node, storage).str();
  return true;
}

llvm::yaml::MappingNode *ConfigParser::getMapping(llvm::StringRef key,
                                                  llvm::yaml::Node *node) {
  auto *mapping = llvm::dyn_cast<llvm::yaml::MappingNode>(node);
  if (!mapping)
    fail("'" + key + "' must be a mapping");
  return mapping;
}

bool ConfigParser::parseReset(llvm::yaml::MappingNode *node) {
  ResetCommandConfig reset;
  bool ok = parseMapping(node, [&](llvm::StringRef key, llvm::yaml::Node *v) {
    if (key == "register")
      return parseString(key, v, reset.registerName);
    if (key == "code")
      return parseInteger(key, v, reset.code);
    return true;
  });
  if (!ok)
    return false;
  if (reset.registerName.empty())
    return fail("'reset' needs a 'register'");
  config.reset = reset;
  return true;
}

bool ConfigParser::parseStimulus(llvm::yaml::MappingNode *node) {
  return parseMapping(node, [&](llvm::StringRef key, llvm::yaml::Node *v) {
    if (key == "covered_weight")
      return parseInteger(key, v, config.coveredWeight);
    if (key == "uncovered_weight")
      return parseInteger(key, v, config.uncoveredWeight);
    return true;
  });
}

bool ConfigParser::parsePulse(llvm::yaml::MappingNode *node) {
  return parseMapping(node, [&](llvm::StringRef key, llvm::yaml::Node *v) {
    if (key == "enabled")
      config.pulseEnabled = getBool(v);
    return true;
  });
}

bool ConfigParser::parseCoverage(llvm::yaml::MappingNode *node) {
  CoverageConfig &cov = config.coverage;
  return parseMapping(node, [&](llvm::StringRef key, llvm::yaml::Node *v) {
    if (key == "at_least")
      return parseInteger(key, v, cov.atLeast);
    if (key == "goal")
      return parseString(key, v, cov.goal);
    if (key == "final_bins") {
      cov.finalBins = getBool(v);
      return true;
    }
    if (key == "report_json")
      return parseString(key, v, cov.reportJSON);
    if (key == "status") {
      auto *status = getMapping(key, v);
      if (!status)
        return false;
      return parseMapping(status,
                          [&](llvm::StringRef item, llvm::yaml::Node *fields) {
                            std::vector<std::string> names;
                            parseStringSequence(fields, names);
                            cov.status.emplace_back(item.str(),
                                                    std::move(names));
                            return true;
                          });
    }
    if (key == "weights") {
      auto *weights = getMapping(key, v);
      if (!weights)
        return false;
      return parseMapping(weights,
                          [&](llvm::StringRef item, llvm::yaml::Node *value) {
                            unsigned weight = 1;
                            if (!parseInteger(item, value, weight))
                              return false;
                            cov.weights.emplace_back(item.str(), weight);
                            return true;
                          });
    }
    return true;
  });
}

bool ConfigParser::parseTimeouts(llvm::yaml::MappingNode *node) {
  return parseMapping(node, [&](llvm::StringRef key, llvm::yaml::Node *v) {
    if (key == "sim_time_us")
      return parseInteger(key, v, config.simTimeLimitUs);
    if (key == "wall_clock_s")
      return parseInteger(key, v, config.wallClockLimitS);
    return true;
  });
}

bool ConfigParser::parseRoot(llvm::yaml::MappingNode *root) {
  return parseMapping(root, [&](llvm::StringRef key, llvm::yaml::Node *value) {
    if (key == "seed")
      return parseInteger(key, value, config.seed);
    if (key == "max_runs")
      return parseInteger(key, value, config.maxRuns);
    if (key == "min_runs")
      return parseInteger(key, value, config.minRuns);
    if (key == "chip_addr")
      return parseInteger(key, value, config.chipAddress);
    if (key == "chip_id")
      return parseInteger(key, value, config.chipId);
    if (key == "chip_id_register")
      return parseString(key, value, config.chipIdRegister);
    if (key == "freq_mhz")
      return parseDouble(key, value, config.freqMHz);
    if (key == "register_map")
      return parseString(key, value, config.registerMap);
    if (key == "scoreboard")
      return parseString(key, value, config.scoreboardMode);
    if (key == "verbosity") {
      unsigned verbosity;
      if (!parseInteger(key, value, verbosity))
        return false;
      config.verbosity = static_cast<int>(verbosity);
      return true;
    }

    // Sections.
    bool isSection = key == "reset" || key == "stimulus" || key == "pulse" ||
                     key == "coverage" || key == "timeouts";
    if (!isSection)
      return true;
    auto *mapping = getMapping(key, value);
    if (!mapping)
      return false;
    if (key == "reset")
      return parseReset(mapping);
    if (key == "stimulus")
      return parseStimulus(mapping);
    if (key == "pulse")
      return parsePulse(mapping);
    if (key == "coverage")
      return parseCoverage(mapping);
    return parseTimeouts(mapping);
  });
}

} // namespace

//===----------------------------------------------------------------------===//
// RunConfig Implementation
//===----------------------------------------------------------------------===//

llvm::Expected<RunConfig> RunConfig::loadFromYAML(llvm::StringRef yamlContent) {
  RunConfig config;

  // Handle empty content as valid empty config
  if (yamlContent.trim().empty())
    return config;

  // Keep parser diagnostics out of the terminal; they become the error.
  llvm::SourceMgr srcMgr;
  std::string diagnostic = "malformed run config YAML";
  srcMgr.setDiagHandler(
      [](const llvm::SMDiagnostic &diag, void *context) {
        *static_cast<std::string *>(context) =
            ("malformed run config YAML: " + diag.getMessage()).str();
      },
      &diagnostic);
  llvm::yaml::Stream stream(yamlContent, srcMgr, /*ShowColors=*/false);

  auto docIt = stream.begin();
  if (docIt == stream.end())
    return config;

  llvm::yaml::Node *rootNode = docIt->getRoot();
  if (stream.failed())
    return llvm::createStringError(std::errc::invalid_argument, "%s",
                                   diagnostic.c_str());
  auto *root = llvm::dyn_cast_or_null<llvm::yaml::MappingNode>(rootNode);
  if (!root)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "run config root must be a mapping");

  ConfigParser parser(config);
  if (!parser.parseRoot(root))
    return llvm::createStringError(std::errc::invalid_argument, "%s",
                                   parser.getProblem().c_str());
  if (stream.failed())
    return llvm::createStringError(std::errc::invalid_argument, "%s",
                                   diagnostic.c_str());

  if (auto err = config.validate())
    return std::move(err);
  return config;
}

llvm::Expected<RunConfig> RunConfig::loadFromFile(llvm::StringRef filePath) {
  auto fileOrErr = llvm::MemoryBuffer::getFile(filePath);
  if (auto ec = fileOrErr.getError())
    return llvm::createStringError(ec, "failed to open run config file: %s",
                                   filePath.str().c_str());

  auto result = loadFromYAML((*fileOrErr)->getBuffer());
  if (!result)
    return result.takeError();

  // Resolve the register map against the directory of the config file.
  if (!result->registerMap.empty() &&
      llvm::sys::path::is_relative(result->registerMap)) {
    llvm::SmallString<256> absPath(filePath);
    llvm::sys::fs::make_absolute(absPath);
    llvm::SmallString<256> mapPath(llvm::sys::path::parent_path(absPath));
    llvm::sys::path::append(mapPath, result->registerMap);
    result->registerMap = mapPath.str().str();
  }
  return result;
}

llvm::Error RunConfig::validate() const {
  if (chipAddress > 7)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "chip_addr %u does not fit in 3 bits",
                                   chipAddress);
  // The chip id fills the high nibble of the chip id register.
  if (chipId > 15)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "chip_id %u does not fit in 4 bits", chipId);
  if (scoreboardMode != "accumulate" && scoreboardMode != "fail_immediately")
    return llvm::createStringError(std::errc::invalid_argument,
                                   "unknown scoreboard mode '%s'",
                                   scoreboardMode.c_str());
  if (!(freqMHz > 0))
    return llvm::createStringError(std::errc::invalid_argument,
                                   "freq_mhz must be positive");
  if (coverage.atLeast == 0)
    return llvm::createStringError(std::errc::invalid_argument,
                                   "coverage at_least must be positive");
  return llvm::Error::success();
}

void RunConfig::print(llvm::raw_ostream &os) const {
  os << "seed: " << seed << "\n";
  os << "max_runs: " << maxRuns << "\n";
  os << "min_runs: " << minRuns << "\n";
  os << "chip_addr: " << chipAddress << "\n";
  os << "chip_id: " << chipId << "\n";
  os << "chip_id_register: " << chipIdRegister << "\n";
  os << "freq_mhz: " << freqMHz << "\n";
  if (!registerMap.empty())
    os << "register_map: " << registerMap << "\n";
  os << "scoreboard: " << scoreboardMode << "\n";
  if (reset)
    os << "reset: {register: " << reset->registerName << ", code: 0x"
       << llvm::utohexstr(reset->code) << "}\n";
  os << "stimulus: {covered_weight: " << coveredWeight
     << ", uncovered_weight: " << uncoveredWeight << "}\n";
  os << "pulse: {enabled: " << (pulseEnabled ? "true" : "false") << "}\n";
  os << "coverage:\n";
  os << "  at_least: " << coverage.atLeast << "\n";
  os << "  goal: " << coverage.goal << "\n";
  os << "  final_bins: " << (coverage.finalBins ? "true" : "false") << "\n";
  if (!coverage.reportJSON.empty())
    os << "  report_json: " << coverage.reportJSON << "\n";
  if (!coverage.status.empty()) {
    os << "  status:\n";
    for (const auto &entry : coverage.status) {
      os << "    " << entry.first << ": [";
      llvm::interleaveComma(entry.second, os, [&](const std::string &field) {
        os << '"' << field << '"';
      });
      os << "]\n";
    }
  }
  if (!coverage.weights.empty()) {
    os << "  weights: {";
    llvm::interleaveComma(coverage.weights, os,
                          [&](const std::pair<std::string, unsigned> &entry) {
                            os << entry.first << ": " << entry.second;
                          });
    os << "}\n";
  }
  os << "timeouts: {sim_time_us: " << simTimeLimitUs
     << ", wall_clock_s: " << wallClockLimitS << "}\n";
  os << "verbosity: " << verbosity << "\n";
}
