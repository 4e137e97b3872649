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

#include <absl/status/status.h>
#include <absl/time/time.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/clock.h"
#include "common/macros.h"

namespace ai_platform {

// Starts full; refills `rate` tokens per second up to `capacity`. Time short
// of a whole token carries over to the next refill.
class TokenBucket final {
 public:
  TokenBucket(int64_t capacity,
              int64_t rate,
              std::shared_ptr<Clock> clock = Clock::real());

  bool allow();

  int64_t tokens();

 private:
  DISALLOW_COPY_AND_ASSIGN(TokenBucket);

  // Requires mutex_ held.
  void refill();

  const int64_t capacity_;
  const int64_t rate_;
  std::shared_ptr<Clock> clock_;

  std::mutex mutex_;
  int64_t tokens_;
  absl::Time last_refill_;
};

// Starts empty; admits while below `capacity` and drains `rate` per second.
class LeakyBucket final {
 public:
  LeakyBucket(int64_t capacity,
              int64_t rate,
              std::shared_ptr<Clock> clock = Clock::real());

  bool allow();

  int64_t level();

 private:
  DISALLOW_COPY_AND_ASSIGN(LeakyBucket);

  // Requires mutex_ held.
  void leak();

  const int64_t capacity_;
  const int64_t rate_;
  std::shared_ptr<Clock> clock_;

  std::mutex mutex_;
  int64_t level_ = 0;
  absl::Time last_leak_;
};

// Counts events over the trailing `window`, split into `num_buckets` slots.
// A slot expires as a whole once it falls out of the window.
class SlidingWindowCounter final {
 public:
  SlidingWindowCounter(absl::Duration window,
                       int32_t num_buckets,
                       std::shared_ptr<Clock> clock = Clock::real());

  int64_t count();

  void increment();

  // Increments only when the count is below `limit`.
  bool try_increment(int64_t limit);

 private:
  DISALLOW_COPY_AND_ASSIGN(SlidingWindowCounter);

  // Requires mutex_ held.
  int64_t current_slot() const;
  int64_t count_locked(int64_t slot) const;

  const absl::Duration bucket_width_;
  std::shared_ptr<Clock> clock_;

  std::mutex mutex_;
  std::vector<int64_t> counts_;
  // slot number each bucket currently holds
  std::vector<int64_t> slots_;
};

// Per tenant and feature request limit over a sliding one minute window.
class RateLimiter final {
 public:
  explicit RateLimiter(int32_t default_limit,
                       std::shared_ptr<Clock> clock = Clock::real(),
                       absl::Duration window = absl::Minutes(1));

  bool allow(const std::string& tenant_id, const std::string& feature);

  int32_t get_limit(const std::string& tenant_id, const std::string& feature);

  absl::Status set_limit(const std::string& tenant_id,
                         const std::string& feature,
                         int32_t limit);

  // Drops every counter. Limits are kept.
  void reset();

  // Number of keys with a live counter. Counters with nothing left in their
  // window are swept periodically from allow().
  size_t tracked_keys();

 private:
  DISALLOW_COPY_AND_ASSIGN(RateLimiter);

  // Requires mutex_ held.
  int32_t limit_of(const std::string& key) const;
  void sweep_idle_counters();

  const int32_t default_limit_;
  const absl::Duration window_;
  std::shared_ptr<Clock> clock_;

  std::mutex mutex_;
  // "<tenant>:<feature>" -> limit
  std::unordered_map<std::string, int32_t> limits_;
  std::unordered_map<std::string, std::unique_ptr<SlidingWindowCounter>>
      counters_;
  int64_t calls_since_sweep_ = 0;
};

}  // namespace ai_platform
