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

#include "router/routing_engine.h"

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include <algorithm>
#include <variant>

#include "common/errors.h"
#include "common/utils.h"
#include "router/request_params.h"

namespace ai_platform {

namespace {

constexpr double kMillisPerHour = 3600.0 * 1000.0;

nlohmann::json images_to_json(const ImageResults& results) {
  nlohmann::json images = nlohmann::json::array();
  for (const auto& image : results.images) {
    nlohmann::json item;
    if (!image.url.empty()) {
      item["url"] = image.url;
    }
    if (!image.b64_json.empty()) {
      item["b64_json"] = image.b64_json;
    }
    item["width"] = image.width;
    item["height"] = image.height;
    if (image.seed.has_value()) {
      item["seed"] = *image.seed;
    }
    images.push_back(std::move(item));
  }
  return images;
}

// Calls the provider method matching the request kind and folds its result
// into the response.
class ProviderCall {
 public:
  ProviderCall(Provider* provider, InferenceResponse* response)
      : provider_(provider), response_(response) {}

  absl::Status operator()(const TextToImageParams& params) {
    return take_images(provider_->generate_image(params));
  }

  absl::Status operator()(const ImageEditParams& params) {
    return take_images(provider_->edit_image(params));
  }

  absl::Status operator()(const StylizationParams& params) {
    return take_images(provider_->stylize_image(params));
  }

  absl::Status operator()(const TextGenerationParams& params) {
    auto text = provider_->generate_text(params);
    if (!text.ok()) {
      return text.status();
    }
    response_->result["text"] = text->text;
    if (!text->finish_reason.empty()) {
      response_->result["finish_reason"] = text->finish_reason;
    }
    response_->tokens_input = text->tokens_input;
    response_->tokens_output = text->tokens_output;
    return absl::OkStatus();
  }

 private:
  absl::Status take_images(absl::StatusOr<ImageResults> images) {
    if (!images.ok()) {
      return images.status();
    }
    response_->result["images"] = images_to_json(*images);
    response_->image_count = static_cast<int32_t>(images->images.size());
    return absl::OkStatus();
  }

  Provider* provider_;
  InferenceResponse* response_;
};

}  // namespace

nlohmann::json InferenceResponse::to_json() const {
  nlohmann::json json;
  json["request_id"] = request_id;
  json["feature"] = feature;
  json["status"] = status;
  json["provider_type"] = provider_type;
  json["provider_id"] = provider_id;
  if (!instance_id.empty()) {
    json["instance_id"] = instance_id;
  }
  if (!result.is_null()) {
    json["result"] = result;
  }
  json["received_at"] = absl::FormatTime(received_at, absl::UTCTimeZone());
  json["completed_at"] = absl::FormatTime(completed_at, absl::UTCTimeZone());
  json["wait_time_ms"] = wait_time_ms;
  json["queue_time_ms"] = queue_time_ms;
  json["exec_time_ms"] = exec_time_ms;
  json["total_ms"] = total_ms;
  json["tokens_input"] = tokens_input;
  json["tokens_output"] = tokens_output;
  json["image_count"] = image_count;
  json["cost"] = cost;
  json["fallback_used"] = fallback_used;
  return json;
}

std::string key_service_name(const Feature& feature,
                             const ProviderConfig& provider) {
  return provider.model.empty() ? feature.id : provider.model;
}

RoutingEngine::RoutingEngine(const Options& options,
                             std::shared_ptr<ConfigStore> config_store,
                             std::shared_ptr<ServiceRegistry> registry,
                             std::shared_ptr<KeyManager> key_manager,
                             std::shared_ptr<ProviderFactory> provider_factory,
                             std::shared_ptr<Clock> clock)
    : options_(options),
      config_store_(std::move(config_store)),
      registry_(std::move(registry)),
      key_manager_(std::move(key_manager)),
      provider_factory_(std::move(provider_factory)),
      clock_(std::move(clock)) {}

absl::StatusOr<InferenceResponse> RoutingEngine::route(
    const std::string& feature,
    const InferenceParams& params) {
  auto config = resolve_feature(feature);
  if (!config.ok()) {
    return config.status();
  }
  return route_feature(*config, params);
}

absl::StatusOr<InferenceResponse> RoutingEngine::route_json(
    const std::string& feature,
    const nlohmann::json& params) {
  auto config = resolve_feature(feature);
  if (!config.ok()) {
    return config.status();
  }

  auto kind = resolve_feature_kind(config->id);
  if (!kind.ok()) {
    kind = resolve_feature_kind(config->category);
  }
  if (!kind.ok()) {
    return invalid_argument_error(
        absl::StrCat("feature ", config->id, " has no known request kind"));
  }
  auto typed = parse_inference_params(*kind, params);
  if (!typed.ok()) {
    return typed.status();
  }
  return route_feature(*config, *typed);
}

absl::StatusOr<Feature> RoutingEngine::resolve_feature(
    const std::string& feature) {
  auto by_id = config_store_->get_feature(feature);
  if (by_id.ok()) {
    return by_id;
  }

  auto by_category = config_store_->get_features_by_category(feature);
  if (!by_category.ok() || by_category->empty()) {
    return not_found_error(absl::StrCat("feature not found: ", feature));
  }
  return std::move(by_category->front());
}

std::vector<ProviderConfig> RoutingEngine::filter_available_providers(
    const Feature& feature) {
  std::vector<ProviderConfig> available;
  bool has_healthy_instance = false;
  bool instances_checked = false;

  for (const auto& provider : feature.providers) {
    if (!provider.enabled) {
      continue;
    }

    if (provider.type == ProviderType::SELF_HOSTED) {
      if (!instances_checked) {
        has_healthy_instance = !healthy_instances(feature).empty();
        instances_checked = true;
      }
      if (!has_healthy_instance) {
        VLOG(1) << "Skip provider " << provider.id
                << ", no healthy instance for " << feature.id;
        continue;
      }
    } else {
      auto key = key_manager_->get_active_key(
          provider.vendor, key_service_name(feature, provider));
      if (!key.ok()) {
        VLOG(1) << "Skip provider " << provider.id
                << ", no active key: " << key.status();
        continue;
      }
    }
    available.emplace_back(provider);
  }
  return available;
}

absl::StatusOr<InferenceResponse> RoutingEngine::route_feature(
    const Feature& feature,
    const InferenceParams& params) {
  const absl::Time received_at = clock_->now();

  if (!feature.enabled) {
    return unavailable_error(absl::StrCat("feature is disabled: ", feature.id));
  }

  std::vector<ProviderConfig> candidates = filter_available_providers(feature);
  if (candidates.empty()) {
    return unavailable_error(
        absl::StrCat("no available provider for feature: ", feature.id));
  }

  const ProviderConfig* selected = selector_.select(feature, candidates);
  auto response = execute_request(feature, *selected, params, received_at);
  if (response.ok()) {
    return response;
  }

  const absl::Status original = response.status();
  LOG(WARNING) << "Provider " << selected->id << " failed for feature "
               << feature.id << ": " << original;

  const bool fallback_enabled =
      feature.routing.has_value() && feature.routing->fallback_enabled;
  if (!fallback_enabled) {
    return original;
  }

  for (const auto& provider : candidates) {
    if (provider.id == selected->id) {
      continue;
    }
    auto fallback = execute_request(feature, provider, params, received_at);
    if (fallback.ok()) {
      LOG(INFO) << "Feature " << feature.id << " fell back from "
                << selected->id << " to " << provider.id;
      fallback->fallback_used = true;
      return fallback;
    }
    LOG(WARNING) << "Fallback provider " << provider.id << " failed: "
                 << fallback.status();
  }
  return original;
}

absl::StatusOr<InferenceResponse> RoutingEngine::execute_request(
    const Feature& feature,
    const ProviderConfig& provider,
    const InferenceParams& params,
    absl::Time received_at) {
  InferenceResponse response;
  response.request_id = utils::generate_request_id();
  response.feature = feature.id;
  response.provider_type = provider_type_name(provider.type);
  response.provider_id = provider.id;
  response.received_at = received_at;
  response.result = nlohmann::json::object();

  absl::Status status = provider.type == ProviderType::SELF_HOSTED
                            ? execute_self_hosted(
                                  feature, provider, params, &response)
                            : execute_third_party(
                                  feature, provider, params, &response);
  if (!status.ok()) {
    return status;
  }

  response.completed_at = clock_->now();
  response.wait_time_ms =
      absl::ToInt64Milliseconds(response.dispatched_at - response.received_at);
  response.exec_time_ms =
      absl::ToInt64Milliseconds(response.completed_at - response.started_at);
  response.total_ms =
      absl::ToInt64Milliseconds(response.completed_at - response.received_at);
  response.cost = estimate_cost(feature, provider, response.exec_time_ms);
  response.status = "success";
  return response;
}

absl::Status RoutingEngine::execute_self_hosted(const Feature& feature,
                                                const ProviderConfig& provider,
                                                const InferenceParams& params,
                                                InferenceResponse* response) {
  std::vector<ServiceInstance> instances = healthy_instances(feature);
  if (instances.empty()) {
    return unavailable_error("no healthy service available");
  }
  auto least_loaded = std::min_element(
      instances.begin(),
      instances.end(),
      [](const ServiceInstance& a, const ServiceInstance& b) {
        return a.metrics.current_load < b.metrics.current_load;
      });

  ProviderSettings settings;
  settings.endpoint = least_loaded->endpoint();
  settings.model = provider.model;
  settings.timeout_ms = options_.provider_timeout_ms();
  settings.channel = registry_->get_channel(least_loaded->id);
  if (settings.channel == nullptr) {
    return unavailable_error(
        absl::StrCat("cannot reach self hosted instance ", least_loaded->id));
  }
  auto client = provider_factory_->create(kSelfHostedVendor, settings);
  if (!client.ok()) {
    return client.status();
  }

  response->instance_id = least_loaded->id;
  response->dispatched_at = clock_->now();
  response->started_at = response->dispatched_at;
  absl::Status status =
      std::visit(ProviderCall((*client).get(), response), params);
  (*client)->close();
  return status;
}

absl::Status RoutingEngine::execute_third_party(const Feature& feature,
                                                const ProviderConfig& provider,
                                                const InferenceParams& params,
                                                InferenceResponse* response) {
  auto key = key_manager_->get_active_key(provider.vendor,
                                          key_service_name(feature, provider));
  if (!key.ok()) {
    return unavailable_error(absl::StrCat("get API key for ", provider.vendor,
                                          " failed: ", key.status().message()));
  }
  auto secret = key_manager_->get_plaintext_key(*key);
  if (!secret.ok()) {
    return unavailable_error(absl::StrCat(
        "decrypt API key ", key->id, " failed: ", secret.status().message()));
  }

  ProviderSettings settings;
  settings.api_key = std::move(secret).value();
  settings.endpoint = provider.endpoint;
  settings.model = provider.model;
  settings.timeout_ms = options_.provider_timeout_ms();
  auto client = provider_factory_->create(provider.vendor, settings);
  if (!client.ok()) {
    // the feature exists, its vendor client does not
    if (error_kind(client.status()) == ErrorKind::kNotFound) {
      return unavailable_error(absl::StrCat("no client for vendor ",
                                            provider.vendor, " of provider ",
                                            provider.id));
    }
    return client.status();
  }

  response->dispatched_at = clock_->now();
  response->started_at = response->dispatched_at;
  absl::Status status =
      std::visit(ProviderCall((*client).get(), response), params);
  (*client)->close();
  if (!status.ok()) {
    return status;
  }

  KeyUsageRecord usage;
  usage.key_id = key->id;
  usage.request_id = response->request_id;
  usage.feature = feature.id;
  usage.tokens_input = response->tokens_input;
  usage.tokens_output = response->tokens_output;
  usage.image_count = response->image_count;
  usage.cost = estimate_cost(feature, provider, 0);
  absl::Status recorded = key_manager_->record_usage(key->id, usage);
  if (!recorded.ok()) {
    LOG(WARNING) << "Record usage of key " << key->id
                 << " failed: " << recorded;
  }
  return absl::OkStatus();
}

std::vector<ServiceInstance> RoutingEngine::healthy_instances(
    const Feature& feature) {
  std::vector<ServiceInstance> instances =
      registry_->get_healthy_services(feature.id);
  if (instances.empty() && !feature.category.empty() &&
      feature.category != feature.id) {
    instances = registry_->get_healthy_services(feature.category);
  }
  return instances;
}

double RoutingEngine::estimate_cost(const Feature& feature,
                                    const ProviderConfig& provider,
                                    int64_t exec_time_ms) const {
  if (!feature.cost.has_value()) {
    return 0.0;
  }
  if (provider.type == ProviderType::SELF_HOSTED) {
    return feature.cost->self_hosted_per_hour *
           static_cast<double>(exec_time_ms) / kMillisPerHour;
  }
  auto it = feature.cost->third_party_per_request.find(provider.id);
  return it == feature.cost->third_party_per_request.end() ? 0.0 : it->second;
}

}  // namespace ai_platform
