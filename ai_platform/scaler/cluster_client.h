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
#include <absl/status/statusor.h>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "common/macros.h"

namespace ai_platform {

// Replica control of the orchestrator that runs the self-hosted inference
// deployments.
class ClusterClient {
 public:
  virtual ~ClusterClient() = default;

  virtual absl::StatusOr<int32_t> get_replicas(
      const std::string& deployment,
      const std::string& name_space) = 0;

  virtual absl::Status set_replicas(const std::string& deployment,
                                    const std::string& name_space,
                                    int32_t replicas) = 0;
};

// Deployments kept in process. Used by the standalone server and tests.
class InMemoryClusterClient final : public ClusterClient {
 public:
  InMemoryClusterClient() = default;
  ~InMemoryClusterClient() override = default;

  void add_deployment(const std::string& deployment,
                      const std::string& name_space,
                      int32_t replicas);

  absl::StatusOr<int32_t> get_replicas(const std::string& deployment,
                                       const std::string& name_space) override;

  absl::Status set_replicas(const std::string& deployment,
                            const std::string& name_space,
                            int32_t replicas) override;

  size_t set_replicas_calls() const;

 private:
  DISALLOW_COPY_AND_ASSIGN(InMemoryClusterClient);

  mutable std::mutex mutex_;
  // (namespace, deployment) -> replicas
  std::map<std::pair<std::string, std::string>, int32_t> deployments_;
  size_t set_replicas_calls_ = 0;
};

}  // namespace ai_platform
