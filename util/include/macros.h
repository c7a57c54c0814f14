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

#define GET_MACRO(_1, _2, _3, _4, _5, _6, NAME, ...) NAME
#define KVARGS(...) GET_MACRO(__VA_ARGS__, KVARGS6, KVARGS5, KVARGS4, KVARGS3, KVARGS2, KVARGS1, UNUSED)(__VA_ARGS__)
#define KVARGS6(_1, _2, _3, _4, _5, _6) (#_1, _1, #_2, _2, #_3, _3, #_4, _4, #_5, _5, #_6, _6)
#define KVARGS5(_1, _2, _3, _4, _5) (#_1, _1, #_2, _2, #_3, _3, #_4, _4, #_5, _5)
#define KVARGS4(_1, _2, _3, _4) (#_1, _1, #_2, _2, #_3, _3, #_4, _4)
#define KVARGS3(_1, _2, _3) (#_1, _1, #_2, _2, #_3, _3)
#define KVARGS2(_1, _2) (#_1, _1, #_2, _2)
#define KVARGS1(_1) (#_1, _1)

#define UNUSED(expr) (void)(expr)
