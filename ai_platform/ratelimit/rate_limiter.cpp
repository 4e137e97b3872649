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

#include "ratelimit/rate_limiter.h"

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include <algorithm>
#include <utility>

#include "common/errors.h"

namespace ai_platform {

namespace {

constexpr int32_t kWindowBuckets = 60;

// allow() calls between two sweeps of idle counters
constexpr int64_t kSweepEveryCalls = 1024;

std::string limit_key(const std::string& tenant_id,
                      const std::string& feature) {
  return absl::StrCat(tenant_id, ":", feature);
}

}  // namespace

TokenBucket::TokenBucket(int64_t capacity,
                         int64_t rate,
                         std::shared_ptr<Clock> clock)
    : capacity_(std::max<int64_t>(capacity, 0)),
      rate_(std::max<int64_t>(rate, 0)),
      clock_(std::move(clock)),
      tokens_(capacity_),
      last_refill_(clock_->now()) {}

bool TokenBucket::allow() {
  std::lock_guard<std::mutex> lock(mutex_);
  refill();
  if (tokens_ <= 0) {
    return false;
  }
  --tokens_;
  return true;
}

int64_t TokenBucket::tokens() {
  std::lock_guard<std::mutex> lock(mutex_);
  refill();
  return tokens_;
}

void TokenBucket::refill() {
  const absl::Time now = clock_->now();
  const int64_t added = static_cast<int64_t>(
      absl::ToDoubleSeconds(now - last_refill_) * static_cast<double>(rate_));
  if (added <= 0) {
    return;
  }
  if (tokens_ + added >= capacity_) {
    tokens_ = capacity_;
    last_refill_ = now;
  } else {
    // keep the fraction of a token earned since the last whole one
    tokens_ += added;
    last_refill_ += absl::Seconds(added) / rate_;
  }
}

LeakyBucket::LeakyBucket(int64_t capacity,
                         int64_t rate,
                         std::shared_ptr<Clock> clock)
    : capacity_(std::max<int64_t>(capacity, 0)),
      rate_(std::max<int64_t>(rate, 0)),
      clock_(std::move(clock)),
      last_leak_(clock_->now()) {}

bool LeakyBucket::allow() {
  std::lock_guard<std::mutex> lock(mutex_);
  leak();
  if (level_ >= capacity_) {
    return false;
  }
  ++level_;
  return true;
}

int64_t LeakyBucket::level() {
  std::lock_guard<std::mutex> lock(mutex_);
  leak();
  return level_;
}

void LeakyBucket::leak() {
  const absl::Time now = clock_->now();
  const int64_t leaked = static_cast<int64_t>(
      absl::ToDoubleSeconds(now - last_leak_) * static_cast<double>(rate_));
  if (leaked <= 0) {
    return;
  }
  if (leaked > level_) {
    level_ = 0;
    last_leak_ = now;
  } else {
    level_ -= leaked;
    last_leak_ += absl::Seconds(leaked) / rate_;
  }
}

SlidingWindowCounter::SlidingWindowCounter(absl::Duration window,
                                           int32_t num_buckets,
                                           std::shared_ptr<Clock> clock)
    : bucket_width_(window / std::max(num_buckets, 1)),
      clock_(std::move(clock)),
      counts_(static_cast<size_t>(std::max(num_buckets, 1)), 0),
      slots_(static_cast<size_t>(std::max(num_buckets, 1)), -1) {}

int64_t SlidingWindowCounter::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  return count_locked(current_slot());
}

void SlidingWindowCounter::increment() {
  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t slot = current_slot();
  const size_t index = static_cast<size_t>(slot) % counts_.size();
  if (slots_[index] != slot) {
    slots_[index] = slot;
    counts_[index] = 0;
  }
  ++counts_[index];
}

bool SlidingWindowCounter::try_increment(int64_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int64_t slot = current_slot();
  if (count_locked(slot) >= limit) {
    return false;
  }
  const size_t index = static_cast<size_t>(slot) % counts_.size();
  if (slots_[index] != slot) {
    slots_[index] = slot;
    counts_[index] = 0;
  }
  ++counts_[index];
  return true;
}

int64_t SlidingWindowCounter::current_slot() const {
  absl::Duration remainder;
  return absl::IDivDuration(clock_->now() - absl::UnixEpoch(), bucket_width_,
                            &remainder);
}

int64_t SlidingWindowCounter::count_locked(int64_t slot) const {
  const int64_t oldest = slot - static_cast<int64_t>(counts_.size()) + 1;
  int64_t total = 0;
  for (size_t i = 0; i < counts_.size(); ++i) {
    if (slots_[i] >= oldest && slots_[i] <= slot) {
      total += counts_[i];
    }
  }
  return total;
}

RateLimiter::RateLimiter(int32_t default_limit,
                         std::shared_ptr<Clock> clock,
                         absl::Duration window)
    : default_limit_(default_limit),
      window_(window),
      clock_(std::move(clock)) {}

bool RateLimiter::allow(const std::string& tenant_id,
                        const std::string& feature) {
  const std::string key = limit_key(tenant_id, feature);
  std::lock_guard<std::mutex> lock(mutex_);
  if (++calls_since_sweep_ >= kSweepEveryCalls) {
    sweep_idle_counters();
    calls_since_sweep_ = 0;
  }
  auto& counter = counters_[key];
  if (!counter) {
    counter = std::make_unique<SlidingWindowCounter>(window_, kWindowBuckets,
                                                     clock_);
  }
  if (!counter->try_increment(limit_of(key))) {
    VLOG(1) << "Rate limit exceeded for " << key;
    return false;
  }
  return true;
}

int32_t RateLimiter::get_limit(const std::string& tenant_id,
                               const std::string& feature) {
  std::lock_guard<std::mutex> lock(mutex_);
  return limit_of(limit_key(tenant_id, feature));
}

absl::Status RateLimiter::set_limit(const std::string& tenant_id,
                                    const std::string& feature,
                                    int32_t limit) {
  if (limit < 0) {
    return invalid_argument_error("limit must not be negative");
  }
  const std::string key = limit_key(tenant_id, feature);
  LOG(INFO) << "Set rate limit of " << key << " to " << limit
            << " per " << window_;
  std::lock_guard<std::mutex> lock(mutex_);
  limits_.insert_or_assign(key, limit);
  return absl::OkStatus();
}

void RateLimiter::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  counters_.clear();
  calls_since_sweep_ = 0;
}

size_t RateLimiter::tracked_keys() {
  std::lock_guard<std::mutex> lock(mutex_);
  return counters_.size();
}

void RateLimiter::sweep_idle_counters() {
  size_t dropped = 0;
  for (auto it = counters_.begin(); it != counters_.end();) {
    if (it->second->count() == 0) {
      it = counters_.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  VLOG(1) << "Dropped " << dropped << " idle rate limit counters, "
          << counters_.size() << " left";
}

int32_t RateLimiter::limit_of(const std::string& key) const {
  auto it = limits_.find(key);
  return it == limits_.end() ? default_limit_ : it->second;
}

}  // namespace ai_platform
