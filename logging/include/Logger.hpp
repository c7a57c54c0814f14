// Fedmint
//
// Copyright (c) 2022 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0 License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to
// the terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

#pragma once

#define MDC_THREAD_KEY "thread"
#define MDC_TX_ID_KEY "txid"
#define MDC_MINT_KEY "mint"

#include <cstdint>
#include <string>

uint64_t getSeq();

#ifndef USE_LOG4CPP
#include "Logging.hpp"
#else
#include "Logging4cplus.hpp"
#endif

extern logging::Logger GL;
extern logging::Logger TBS_LOG;
extern logging::Logger ISSUANCE_LOG;
extern logging::Logger GATEWAY_LOG;
extern logging::Logger COIN_STORE_LOG;

namespace logging {

Logger getLogger(const std::string& name);
void initLogger(const std::string& configFileName);

class ScopedMdc {
 public:
  ScopedMdc(const std::string& key, const std::string& val);
  ~ScopedMdc();

 private:
  const std::string key_;
};

}  // namespace logging

/*
 * Attach a key-value pair to every log line written from the current thread until the end of the enclosing scope.
 */
#define SCOPED_MDC(k, v) logging::ScopedMdc __s_mdc__(k, v)
#define SCOPED_MDC_TX_ID(v) logging::ScopedMdc __s_mdc_tx_id__(MDC_TX_ID_KEY, v)
#define SCOPED_MDC_MINT(v) logging::ScopedMdc __s_mdc_mint__(MDC_MINT_KEY, v)
