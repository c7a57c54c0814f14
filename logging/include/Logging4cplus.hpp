// Fedmint
//
// Copyright (c) 2022 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0 License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

#pragma once

#ifdef USE_LOG4CPP

#include <string>

#include <log4cplus/configurator.h>
#include <log4cplus/loggingmacros.h>
#include <log4cplus/mdc.h>

namespace logging {

typedef log4cplus::Logger Logger;

// Empty if the key is not set on this thread.
std::string mdcGet(const std::string& key);

}  // namespace logging

// The function name is taken from the pattern's %M column.
#define LOG_TRACE(l, s) LOG4CPLUS_TRACE(l, s)
#define LOG_DEBUG(l, s) LOG4CPLUS_DEBUG(l, s)
#define LOG_INFO(l, s) LOG4CPLUS_INFO(l, s)
#define LOG_WARN(l, s) LOG4CPLUS_WARN(l, s)
#define LOG_ERROR(l, s) LOG4CPLUS_ERROR(l, s)
#define LOG_FATAL(l, s) LOG4CPLUS_FATAL(l, s)

#define MDC_PUT(k, v) log4cplus::getMDC().put(k, v)
#define MDC_REMOVE(k) log4cplus::getMDC().remove(k)
#define MDC_CLEAR log4cplus::getMDC().clear()
#define MDC_GET(k) logging::mdcGet(k)

// The watcher thread re-reads the properties file every `millis` milliseconds for the lifetime of the scope.
#define LOG_CONFIGURE_AND_WATCH(config_file, millis) \
  log4cplus::ConfigureAndWatchThread configureThread(config_file, millis)

#endif
