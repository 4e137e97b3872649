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

#include "common/periodic_task.h"

#include <glog/logging.h>

namespace ai_platform {

PeriodicTask::PeriodicTask(std::string name,
                           absl::Duration interval,
                           std::function<void()> task)
    : name_(std::move(name)), interval_(interval), task_(std::move(task)) {}

PeriodicTask::~PeriodicTask() { stop(); }

void PeriodicTask::start() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { run(); });
  LOG(INFO) << "Periodic task " << name_ << " started, interval "
            << absl::FormatDuration(interval_);
}

void PeriodicTask::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  LOG(INFO) << "Periodic task " << name_ << " stopped";
}

bool PeriodicTask::running() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return running_;
}

void PeriodicTask::run() {
  const auto interval = absl::ToChronoMilliseconds(interval_);
  while (true) {
    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (cv_.wait_for(lock, interval, [this]() { return !running_; })) {
        return;
      }
    }
    task_();
  }
}

}  // namespace ai_platform
