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

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ai_platform {

enum class ProviderType : int8_t {
  SELF_HOSTED = 0,
  THIRD_PARTY = 1,
};

// "self_hosted" / "third_party"
const char* provider_type_name(ProviderType type);

enum class RoutingPolicy : int8_t {
  PRIORITY = 0,
  WEIGHTED = 1,
  COST_BASED = 2,
};

const char* routing_policy_name(RoutingPolicy policy);

// Unknown names resolve to PRIORITY.
RoutingPolicy parse_routing_policy(const std::string& name);

// One way of serving a feature. Lower priority is preferred; weight is the
// traffic share under the weighted policy.
struct ProviderConfig {
  std::string id;
  std::string feature_id;
  ProviderType type = ProviderType::SELF_HOSTED;
  std::string vendor;
  bool enabled = true;
  int32_t priority = 0;
  int32_t weight = 0;

  // self hosted
  std::string image;
  int32_t min_instances = 0;
  int32_t max_instances = 0;

  // third party
  std::string model;
  std::string endpoint;
  std::string api_key_ref;
};

// timeout_s, max_retries and retry_backoff are carried for the provider
// clients; the routing core does not enforce them.
struct RoutingStrategy {
  RoutingPolicy policy = RoutingPolicy::PRIORITY;
  bool fallback_enabled = false;
  int32_t timeout_s = 0;
  int32_t max_retries = 0;
  std::string retry_backoff;
};

struct CostConfig {
  double self_hosted_per_hour = 0.0;
  // provider id -> cost of one request
  std::unordered_map<std::string, double> third_party_per_request;
};

struct Feature {
  std::string id;
  std::string name;
  std::string category;
  std::string description;
  bool enabled = true;
  std::vector<ProviderConfig> providers;
  std::optional<RoutingStrategy> routing;
  std::optional<CostConfig> cost;
};

absl::StatusOr<Feature> parse_feature(const nlohmann::json& json);

// Accepts either an array of features or {"features": [...]}.
absl::StatusOr<std::vector<Feature>> parse_features(
    const nlohmann::json& json);

}  // namespace ai_platform
