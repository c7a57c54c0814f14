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

namespace logging {

ScopedMdc::ScopedMdc(const std::string& key, const std::string& val) : key_{key} { MDC_PUT(key, val); }
ScopedMdc::~ScopedMdc() { MDC_REMOVE(key_); }

}  // namespace logging

thread_local uint64_t fedmint_log_seq = 0;
uint64_t getSeq() { return fedmint_log_seq++; }

// globally defined loggers
logging::Logger GL = logging::getLogger("fedmint");
logging::Logger TBS_LOG = logging::getLogger("fedmint.tbs");
logging::Logger ISSUANCE_LOG = logging::getLogger("fedmint.client.issuance");
logging::Logger GATEWAY_LOG = logging::getLogger("fedmint.client.gateway");
logging::Logger COIN_STORE_LOG = logging::getLogger("fedmint.client.coin-store");
