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

#include <absl/status/statusor.h>
#include <absl/time/time.h>

#include <cstdint>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "common/clock.h"
#include "common/feature_config.h"
#include "common/inference_types.h"
#include "common/macros.h"
#include "common/options.h"
#include "provider/key_manager.h"
#include "provider/provider_factory.h"
#include "registry/service_registry.h"
#include "router/provider_selector.h"
#include "storage/storage.h"

namespace ai_platform {

struct InferenceResponse {
  std::string request_id;
  std::string feature;
  std::string status;
  std::string provider_type;
  std::string provider_id;
  // self-hosted instance that served the request
  std::string instance_id;
  nlohmann::json result;

  absl::Time received_at = absl::UnixEpoch();
  absl::Time dispatched_at = absl::UnixEpoch();
  absl::Time started_at = absl::UnixEpoch();
  absl::Time completed_at = absl::UnixEpoch();

  int64_t wait_time_ms = 0;
  int64_t queue_time_ms = 0;
  int64_t exec_time_ms = 0;
  int64_t total_ms = 0;

  int32_t tokens_input = 0;
  int32_t tokens_output = 0;
  int32_t image_count = 0;

  double cost = 0.0;
  bool fallback_used = false;

  nlohmann::json to_json() const;
};

// Decides which backend serves a request and executes it there.
//
// Route runs inline on the caller's thread and holds no lock of its own;
// every registry or key lookup is a self-contained call.
class RoutingEngine final {
 public:
  RoutingEngine(const Options& options,
                std::shared_ptr<ConfigStore> config_store,
                std::shared_ptr<ServiceRegistry> registry,
                std::shared_ptr<KeyManager> key_manager,
                std::shared_ptr<ProviderFactory> provider_factory,
                std::shared_ptr<Clock> clock = Clock::real());

  ~RoutingEngine() = default;

  absl::StatusOr<InferenceResponse> route(const std::string& feature,
                                          const InferenceParams& params);

  // Validates loosely typed `params` against the resolved feature's kind,
  // then routes them.
  absl::StatusOr<InferenceResponse> route_json(const std::string& feature,
                                               const nlohmann::json& params);

  // By id, then by category (first match).
  absl::StatusOr<Feature> resolve_feature(const std::string& feature);

  // Enabled providers that can serve right now, in configured order.
  std::vector<ProviderConfig> filter_available_providers(
      const Feature& feature);

  ProviderSelector& selector() { return selector_; }

 private:
  DISALLOW_COPY_AND_ASSIGN(RoutingEngine);

  absl::StatusOr<InferenceResponse> route_feature(
      const Feature& feature,
      const InferenceParams& params);

  absl::StatusOr<InferenceResponse> execute_request(
      const Feature& feature,
      const ProviderConfig& provider,
      const InferenceParams& params,
      absl::Time received_at);

  absl::Status execute_self_hosted(const Feature& feature,
                                   const ProviderConfig& provider,
                                   const InferenceParams& params,
                                   InferenceResponse* response);

  absl::Status execute_third_party(const Feature& feature,
                                   const ProviderConfig& provider,
                                   const InferenceParams& params,
                                   InferenceResponse* response);

  // Instances registered under the feature id, else under its category.
  std::vector<ServiceInstance> healthy_instances(const Feature& feature);

  double estimate_cost(const Feature& feature,
                       const ProviderConfig& provider,
                       int64_t exec_time_ms) const;

 private:
  Options options_;

  std::shared_ptr<ConfigStore> config_store_;
  std::shared_ptr<ServiceRegistry> registry_;
  std::shared_ptr<KeyManager> key_manager_;
  std::shared_ptr<ProviderFactory> provider_factory_;
  std::shared_ptr<Clock> clock_;

  ProviderSelector selector_;
};

// Key service name for a third party provider: its model, else the feature.
std::string key_service_name(const Feature& feature,
                             const ProviderConfig& provider);

}  // namespace ai_platform
