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

#include <absl/time/time.h>

#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "common/macros.h"

namespace ai_platform {

// Runs `task` every `interval` on a dedicated thread between start() and
// stop(). The first run happens one interval after start(). stop() wakes the
// thread immediately and joins it.
class PeriodicTask final {
 public:
  PeriodicTask(std::string name,
               absl::Duration interval,
               std::function<void()> task);

  ~PeriodicTask();

  // No-op when already running.
  void start();

  void stop();

  bool running() const;

  const std::string& name() const { return name_; }

 private:
  DISALLOW_COPY_AND_ASSIGN(PeriodicTask);

  void run();

  const std::string name_;
  const absl::Duration interval_;
  std::function<void()> task_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool running_ = false;
  std::thread thread_;
};

}  // namespace ai_platform
