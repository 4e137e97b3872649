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

#include <memory>
#include <mutex>

namespace ai_platform {

// Source of wall time for every component. Tests swap in a ManualClock so
// heartbeat timeouts, cooldowns and rate windows advance without sleeping.
class Clock {
 public:
  virtual ~Clock() = default;

  virtual absl::Time now() const = 0;

  // Process wide clock backed by absl::Now().
  static std::shared_ptr<Clock> real();
};

class ManualClock final : public Clock {
 public:
  explicit ManualClock(absl::Time start = absl::FromUnixSeconds(1700000000))
      : now_(start) {}

  absl::Time now() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
  }

  void advance(absl::Duration delta) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ += delta;
  }

  void set(absl::Time time) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = time;
  }

 private:
  mutable std::mutex mutex_;
  absl::Time now_;
};

}  // namespace ai_platform
