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

#include "scaler/cluster_client.h"

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include "common/errors.h"

namespace ai_platform {

void InMemoryClusterClient::add_deployment(const std::string& deployment,
                                           const std::string& name_space,
                                           int32_t replicas) {
  std::lock_guard<std::mutex> lock(mutex_);
  deployments_[{name_space, deployment}] = replicas;
}

absl::StatusOr<int32_t> InMemoryClusterClient::get_replicas(
    const std::string& deployment,
    const std::string& name_space) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = deployments_.find({name_space, deployment});
  if (it == deployments_.end()) {
    return not_found_error(
        absl::StrCat("deployment not found: ", name_space, "/", deployment));
  }
  return it->second;
}

absl::Status InMemoryClusterClient::set_replicas(const std::string& deployment,
                                                 const std::string& name_space,
                                                 int32_t replicas) {
  if (replicas < 0) {
    return invalid_argument_error("replicas must not be negative");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = deployments_.find({name_space, deployment});
  if (it == deployments_.end()) {
    return not_found_error(
        absl::StrCat("deployment not found: ", name_space, "/", deployment));
  }
  ++set_replicas_calls_;
  LOG(INFO) << "Set replicas of " << name_space << "/" << deployment
            << " from " << it->second << " to " << replicas;
  it->second = replicas;
  return absl::OkStatus();
}

size_t InMemoryClusterClient::set_replicas_calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return set_replicas_calls_;
}

}  // namespace ai_platform
