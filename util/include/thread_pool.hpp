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

#pragma once

#include <condition_variable>
#include <future>
#include <mutex>
#include <queue>
#include <system_error>
#include <thread>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "assertUtils.hpp"

namespace fedmint::util {

// Fixed-size pool of worker threads. Tasks run in submission order as workers become free.
class ThreadPool {
 public:
  // Throws std::system_error if a thread cannot be started. Threads started before the failure are joined first.
  explicit ThreadPool(unsigned int thread_count) {
    FedmintAssertGT(thread_count, 0u);
    threads_.reserve(thread_count);
    try {
      for (auto i = 0u; i < thread_count; ++i) {
        threads_.emplace_back([this]() { loop(); });
      }
    } catch (const std::system_error&) {
      stop();
      throw;
    }
  }

  // Stops the pool after the tasks already queued have run.
  ~ThreadPool() noexcept { stop(); }

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Runs `func(args...)` on a pool thread. Arguments are copied or moved into the task. An exception thrown by the
  // task is stored in the returned future and rethrown by get().
  template <class F, class... Args>
  auto async(F&& func, Args&&... args) {
    using ResultType = std::invoke_result_t<std::decay_t<F>, std::decay_t<Args>...>;
    auto ptask = std::packaged_task<ResultType(std::decay_t<Args>...)>{std::forward<F>(func)};
    auto future = ptask.get_future();
    auto task = Task{[ptask = std::move(ptask), tup = std::make_tuple(std::forward<Args>(args)...)]() mutable {
      std::apply(ptask, std::move(tup));
    }};
    {
      auto lock = std::lock_guard{queue_.mutex};
      queue_.tasks.push(std::move(task));
    }
    queue_.cv.notify_one();
    return future;
  }

 private:
  using Task = std::packaged_task<void()>;

  void stop() noexcept {
    {
      auto lock = std::lock_guard{queue_.mutex};
      queue_.stop = true;
    }
    queue_.cv.notify_all();
    for (auto& t : threads_) {
      t.join();
    }
    threads_.clear();
  }

  void loop() noexcept {
    while (true) {
      auto lock = std::unique_lock{queue_.mutex};
      queue_.cv.wait(lock, [this]() { return !queue_.tasks.empty() || queue_.stop; });
      if (queue_.tasks.empty()) break;
      auto task = std::move(queue_.tasks.front());
      queue_.tasks.pop();
      lock.unlock();
      // The packaged_task captures exceptions into the caller's future.
      task();
    }
  }

  struct TaskQueue {
    std::queue<Task> tasks;
    std::mutex mutex;
    std::condition_variable cv;
    bool stop{false};
  };

  TaskQueue queue_;
  std::vector<std::thread> threads_;
};

}  // namespace fedmint::util
