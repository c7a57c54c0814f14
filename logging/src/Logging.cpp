// Fedmint
//
// Copyright (c) 2022 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0 License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license,
// as noted in the LICENSE file.

#include "Logger.hpp"

#include <fstream>
#include <iostream>
#include <map>
#include <mutex>

namespace logging {

std::array<std::string, 6> LoggerImpl::LEVELS_STRINGS = {"TRACE", "DEBUG", "INFO ", "WARN ", "ERROR", "FATAL"};

// Loggers are normally fetched once at static-initialization time, so the registry lock is not contended.
Logger getLogger(const std::string& name) {
  static std::map<std::string, LoggerImpl> registry;
  static std::mutex mux;
  std::lock_guard g(mux);
  return registry.try_emplace(name, name).first->second;
}

void initLogger(const std::string& configFileName) {
  if (!Logger::config(configFileName)) {
    std::clog << "using default logging configuration" << std::endl;
  }
}

static bool parseLevel(const std::string& str, LogLevel& out) {
  static const std::map<std::string, LogLevel> levels = {{"TRACE", LogLevel::trace},
                                                          {"DEBUG", LogLevel::debug},
                                                          {"INFO", LogLevel::info},
                                                          {"WARN", LogLevel::warn},
                                                          {"ERROR", LogLevel::error},
                                                          {"FATAL", LogLevel::fatal}};
  auto it = levels.find(str);
  if (it == levels.end()) return false;
  out = it->second;
  return true;
}

/**
 * One logger per line:
 *   log.<logger name>:<LEVEL>
 * Lines starting with '#' and lines without the "log." prefix are skipped.
 */
bool Logger::config(const std::string& configFileName) {
  std::ifstream infile(configFileName);
  if (!infile.is_open()) {
    std::cerr << __PRETTY_FUNCTION__ << ": can't open " << configFileName << std::endl;
    return false;
  }
  std::string line;
  while (std::getline(infile, line)) {
    if (line.empty() || line[0] == '#') continue;
    if (line.compare(0, 4, "log.")) continue;
    line.erase(0, 4);
    if (size_t pos = line.find(':'); pos != line.npos) {
      std::string logger = line.substr(0, pos);
      std::string levelStr = line.substr(pos + 1);
      LogLevel level;
      if (!parseLevel(levelStr, level)) {
        std::cerr << __PRETTY_FUNCTION__ << ": ignoring invalid log level " << levelStr << std::endl;
        continue;
      }
      getLogger(logger).setLogLevel(level);
    }
  }
  return true;
}

}  // namespace logging
