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

#include <cstdlib>
#include <fstream>
#include <iostream>

#include <log4cplus/consoleappender.h>
#include <log4cplus/helpers/property.h>
#include <log4cplus/initializer.h>
#include <log4cplus/logger.h>
#include <log4cplus/loglevel.h>

namespace logging {

namespace {

// Same columns as the console logger.
const char* kLogPattern = "%d{%Y-%m-%dT%H:%M:%S,%qZ}|%-5p|%c|%X{thread}|%X{txid}|%X{mint}|%M|%m%n";

// FEDMINT_LOG_LEVEL=DEBUG and the like lower the root level before a properties file is read.
log4cplus::LogLevel rootLevel() {
  const char* env = std::getenv("FEDMINT_LOG_LEVEL");
  if (!env) return log4cplus::INFO_LOG_LEVEL;
  const auto level = log4cplus::getLogLevelManager().fromString(env);
  return level == log4cplus::NOT_SET_LOG_LEVEL ? log4cplus::INFO_LOG_LEVEL : level;
}

bool installConsoleAppender() {
  log4cplus::initialize();
  log4cplus::SharedAppenderPtr appender(new log4cplus::ConsoleAppender(true, true));
  appender->setLayout(std::unique_ptr<log4cplus::Layout>(new log4cplus::PatternLayout(kLogPattern)));
  auto root = log4cplus::Logger::getRoot();
  root.addAppender(appender);
  root.setLogLevel(rootLevel());
  return true;
}

}  // namespace

void initLogger(const std::string& configFileName) {
  if (!std::ifstream(configFileName).good()) {
    std::cerr << "fedmint: cannot read log configuration " << configFileName << ", logging to the console"
              << std::endl;
    return;
  }
  log4cplus::PropertyConfigurator(log4cplus::helpers::Properties(configFileName)).configure();
}

Logger getLogger(const std::string& name) {
  static const bool installed = installConsoleAppender();
  (void)installed;
  return log4cplus::Logger::getInstance(name);
}

std::string mdcGet(const std::string& key) {
  std::string value;
  log4cplus::getMDC().get(&value, key);
  return value;
}

}  // namespace logging
