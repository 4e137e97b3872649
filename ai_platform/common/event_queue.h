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
#include <glog/logging.h>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "common/macros.h"

namespace ai_platform {

// Bounded FIFO used for best-effort notification streams.
//
// Overflow policy is drop-newest: try_push() never blocks and discards the
// incoming item when the queue is full. Consumers must tolerate gaps.
template <typename T>
class BoundedQueue final {
 public:
  explicit BoundedQueue(size_t capacity)
      : capacity_(std::max<size_t>(capacity, 1)) {}

  bool try_push(T item) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_ || items_.size() >= capacity_) {
        ++dropped_;
        return false;
      }
      items_.emplace_back(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  // Waits up to `timeout` for an item. Returns false on timeout, or once the
  // queue is closed and drained.
  bool pop(T* item, absl::Duration timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, absl::ToChronoNanoseconds(timeout), [this]() {
      return closed_ || !items_.empty();
    });
    if (items_.empty()) {
      return false;
    }
    *item = std::move(items_.front());
    items_.pop_front();
    return true;
  }

  bool try_pop(T* item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (items_.empty()) {
      return false;
    }
    *item = std::move(items_.front());
    items_.pop_front();
    return true;
  }

  // Wakes every blocked consumer. Items already queued can still be popped.
  void close() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
  }

  size_t capacity() const { return capacity_; }

  uint64_t dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
  }

 private:
  DISALLOW_COPY_AND_ASSIGN(BoundedQueue);

  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<T> items_;
  bool closed_ = false;
  uint64_t dropped_ = 0;
};

// Fans every published event out to all live subscribers.
//
// A subscriber cancels by closing its queue; closed queues are pruned on the
// next publish. publish() never blocks the producer.
template <typename T>
class EventBroadcaster final {
 public:
  EventBroadcaster(std::string name, size_t subscriber_capacity)
      : name_(std::move(name)), subscriber_capacity_(subscriber_capacity) {}

  ~EventBroadcaster() { close_all(); }

  std::shared_ptr<BoundedQueue<T>> subscribe() {
    auto queue = std::make_shared<BoundedQueue<T>>(subscriber_capacity_);
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_.push_back(queue);
    return queue;
  }

  // Returns the number of subscribers that accepted the event.
  size_t publish(const T& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t delivered = 0;
    auto it = subscribers_.begin();
    while (it != subscribers_.end()) {
      if ((*it)->closed()) {
        it = subscribers_.erase(it);
        continue;
      }
      if ((*it)->try_push(event)) {
        ++delivered;
      } else {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        LOG_EVERY_N(WARNING, 100)
            << "Subscriber of " << name_ << " is full, drop event";
      }
      ++it;
    }
    return delivered;
  }

  void close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& queue : subscribers_) {
      queue->close();
    }
    subscribers_.clear();
  }

  size_t subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
  }

  uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

  const std::string& name() const { return name_; }

 private:
  DISALLOW_COPY_AND_ASSIGN(EventBroadcaster);

  const std::string name_;
  const size_t subscriber_capacity_;
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<BoundedQueue<T>>> subscribers_;
  std::atomic<uint64_t> dropped_{0};
};

}  // namespace ai_platform
