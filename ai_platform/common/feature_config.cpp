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

#include "common/feature_config.h"

#include <absl/strings/str_cat.h>

#include "common/errors.h"

namespace ai_platform {

const char* provider_type_name(ProviderType type) {
  switch (type) {
    case ProviderType::SELF_HOSTED:
      return "self_hosted";
    case ProviderType::THIRD_PARTY:
      return "third_party";
  }
  return "unknown";
}

const char* routing_policy_name(RoutingPolicy policy) {
  switch (policy) {
    case RoutingPolicy::PRIORITY:
      return "priority";
    case RoutingPolicy::WEIGHTED:
      return "weighted";
    case RoutingPolicy::COST_BASED:
      return "cost_based";
  }
  return "unknown";
}

RoutingPolicy parse_routing_policy(const std::string& name) {
  if (name == "weighted") {
    return RoutingPolicy::WEIGHTED;
  }
  if (name == "cost_based") {
    return RoutingPolicy::COST_BASED;
  }
  return RoutingPolicy::PRIORITY;
}

namespace {

absl::StatusOr<ProviderConfig> parse_provider(const nlohmann::json& json,
                                              const std::string& feature_id) {
  if (!json.is_object()) {
    return invalid_argument_error("provider entry must be an object");
  }
  ProviderConfig provider;
  provider.id = json.value("id", "");
  if (provider.id.empty()) {
    return invalid_argument_error(
        absl::StrCat("provider of feature ", feature_id, " has no id"));
  }
  provider.feature_id = feature_id;

  const std::string type = json.value("type", "");
  if (type == "self_hosted") {
    provider.type = ProviderType::SELF_HOSTED;
  } else if (type == "third_party") {
    provider.type = ProviderType::THIRD_PARTY;
  } else {
    return invalid_argument_error(
        absl::StrCat("provider ", provider.id, " has unknown type: ", type));
  }

  provider.vendor = json.value("vendor", "");
  provider.enabled = json.value("enabled", true);
  provider.priority = json.value("priority", 0);
  provider.weight = json.value("weight", 0);
  provider.image = json.value("image", "");
  provider.min_instances = json.value("min_instances", 0);
  provider.max_instances = json.value("max_instances", 0);
  provider.model = json.value("model", "");
  provider.endpoint = json.value("endpoint", "");
  provider.api_key_ref = json.value("api_key_ref", "");

  if (provider.type == ProviderType::THIRD_PARTY && provider.vendor.empty()) {
    return invalid_argument_error(
        absl::StrCat("third party provider ", provider.id, " has no vendor"));
  }
  return provider;
}

absl::StatusOr<Feature> parse_feature_fields(const nlohmann::json& json) {
  Feature feature;
  feature.id = json.value("id", "");
  if (feature.id.empty()) {
    return invalid_argument_error("feature has no id");
  }
  feature.name = json.value("name", feature.id);
  feature.category = json.value("category", "");
  feature.description = json.value("description", "");
  feature.enabled = json.value("enabled", true);

  auto providers = json.find("providers");
  if (providers != json.end() && providers->is_array()) {
    for (const auto& item : *providers) {
      auto provider = parse_provider(item, feature.id);
      if (!provider.ok()) {
        return provider.status();
      }
      feature.providers.emplace_back(std::move(provider).value());
    }
  }

  auto routing = json.find("routing");
  if (routing != json.end() && routing->is_object()) {
    RoutingStrategy strategy;
    strategy.policy = parse_routing_policy(routing->value("strategy", ""));
    strategy.fallback_enabled = routing->value("fallback_enabled", false);
    strategy.timeout_s = routing->value("timeout", 0);
    strategy.max_retries = routing->value("max_retries", 0);
    strategy.retry_backoff = routing->value("retry_backoff", "");
    feature.routing = strategy;
  }

  auto cost = json.find("cost");
  if (cost != json.end() && cost->is_object()) {
    CostConfig cost_config;
    cost_config.self_hosted_per_hour = cost->value("self_hosted_per_hour", 0.0);
    auto per_request = cost->find("third_party_per_request");
    if (per_request != cost->end() && per_request->is_object()) {
      for (auto it = per_request->begin(); it != per_request->end(); ++it) {
        if (!it.value().is_number()) {
          return invalid_argument_error(absl::StrCat(
              "cost of provider ", it.key(), " must be a number"));
        }
        cost_config.third_party_per_request[it.key()] =
            it.value().get<double>();
      }
    }
    feature.cost = cost_config;
  }
  return feature;
}

}  // namespace

absl::StatusOr<Feature> parse_feature(const nlohmann::json& json) {
  if (!json.is_object()) {
    return invalid_argument_error("feature must be an object");
  }
  try {
    return parse_feature_fields(json);
  } catch (const nlohmann::json::type_error& e) {
    return invalid_argument_error(
        absl::StrCat("malformed feature: ", e.what()));
  }
}

absl::StatusOr<std::vector<Feature>> parse_features(
    const nlohmann::json& json) {
  const nlohmann::json* items = &json;
  if (json.is_object()) {
    auto it = json.find("features");
    if (it == json.end()) {
      return invalid_argument_error("missing \"features\" array");
    }
    items = &(*it);
  }
  if (!items->is_array()) {
    return invalid_argument_error("features must be an array");
  }

  std::vector<Feature> features;
  features.reserve(items->size());
  for (const auto& item : *items) {
    auto feature = parse_feature(item);
    if (!feature.ok()) {
      return feature.status();
    }
    features.emplace_back(std::move(feature).value());
  }
  return features;
}

}  // namespace ai_platform
