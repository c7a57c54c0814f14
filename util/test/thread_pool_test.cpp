// Fedmint
//
// Copyright (c) 2022 VMware, Inc. All Rights Reserved.
//
// This product is licensed to you under the Apache 2.0 license (the "License").
// You may not use this product except in compliance with the Apache 2.0
// License.
//
// This product may include a number of subcomponents with separate copyright
// notices and license terms. Your use of these subcomponents is subject to the
// terms and conditions of the subcomponent's license, as noted in the
// LICENSE file.

#include "gtest/gtest.h"

#include "thread_pool.hpp"

#include <atomic>
#include <future>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace {

using namespace fedmint::util;

constexpr auto answer = 42;

TEST(thread_pool, lambda) {
  auto pool = ThreadPool{1};
  auto future = pool.async([]() { return answer; });
  ASSERT_EQ(answer, future.get());
}

TEST(thread_pool, arguments_are_forwarded) {
  auto pool = ThreadPool{2};
  auto future = pool.async([](int a, int b) { return a + b; }, 40, 2);
  ASSERT_EQ(answer, future.get());
}

TEST(thread_pool, exception_is_delivered_through_future) {
  auto pool = ThreadPool{1};
  auto future = pool.async([]() -> int { throw std::runtime_error{"boom"}; });
  ASSERT_THROW(future.get(), std::runtime_error);
  // The worker survives the failed task.
  ASSERT_EQ(answer, pool.async([]() { return answer; }).get());
}

// Every task can block on the others because there is one worker per task.
TEST(thread_pool, one_worker_per_task_runs_all_concurrently) {
  constexpr auto tasks = 8u;
  auto pool = ThreadPool{tasks};
  std::promise<void> release;
  auto released = release.get_future().share();
  std::atomic_uint started{0};
  std::vector<std::future<unsigned>> futures;
  for (auto i = 0u; i < tasks; ++i) {
    futures.push_back(pool.async([&started, released, i]() {
      ++started;
      released.wait();
      return i;
    }));
  }
  while (started < tasks) {
    std::this_thread::yield();
  }
  release.set_value();
  for (auto i = 0u; i < tasks; ++i) {
    ASSERT_EQ(i, futures[i].get());
  }
}

TEST(thread_pool, more_tasks_than_workers_are_queued) {
  auto pool = ThreadPool{2};
  std::vector<std::future<unsigned>> futures;
  for (auto i = 0u; i < 20u; ++i) {
    futures.push_back(pool.async([](unsigned v) { return v * 2; }, i));
  }
  for (auto i = 0u; i < 20u; ++i) {
    ASSERT_EQ(i * 2, futures[i].get());
  }
}

TEST(thread_pool, constructor_may_throw) { static_assert(!std::is_nothrow_constructible_v<ThreadPool, unsigned>); }

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
