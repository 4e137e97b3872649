/* Copyright 2025 The AI Platform Authors. All Rights Reserved.

Licensed under the Apache License, Version 2.0 (the "License");
you may not use this file except in compliance with the License.
You may obtain a copy of the License at

    http://www.apache.org/licenses/LICENSE-2.0

Unless required by applicable law or agreed to in writing, software
distributed under the License is distributed on an "AS IS" BASIS,
WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
See the License for the specific language governing permissions and
limitations under the License.
==============================================================================*/

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

#include "common/macros.h"

namespace ai_platform {

class ThreadPool final {
 public:
  using Runnable = std::function<void()>;

  explicit ThreadPool(size_t num_threads = 1);

  // Runs every queued task, then joins the workers.
  ~ThreadPool();

  // Queues `runnable` and returns immediately. Tasks scheduled after the
  // pool started shutting down are dropped.
  void schedule(Runnable runnable);

  // Blocks until the queue is empty and no task is running.
  void wait_idle();

  size_t size() const { return threads_.size(); }

 private:
  DISALLOW_COPY_AND_ASSIGN(ThreadPool);

  void internal_loop();

  std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<Runnable> queue_;
  size_t running_ = 0;
  bool stopped_ = false;

  std::vector<std::thread> threads_;
};

}  // namespace ai_platform
