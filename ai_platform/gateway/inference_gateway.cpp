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

#include "gateway/inference_gateway.h"

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include <utility>

#include "common/errors.h"
#include "common/feature_config.h"

namespace ai_platform {

namespace {

constexpr char kDefaultTenant[] = "default";

}  // namespace

InferenceGateway::InferenceGateway(
    std::shared_ptr<RateLimiter> rate_limiter,
    std::shared_ptr<AdmissionController> admission,
    std::shared_ptr<RoutingEngine> router)
    : rate_limiter_(std::move(rate_limiter)),
      admission_(std::move(admission)),
      router_(std::move(router)) {}

absl::StatusOr<InferenceResponse> InferenceGateway::handle(
    const GatewayRequest& request) {
  if (request.feature.empty()) {
    return invalid_argument_error("feature is required");
  }
  const std::string tenant_id =
      request.tenant_id.empty() ? kDefaultTenant : request.tenant_id;

  if (rate_limiter_ && !rate_limiter_->allow(tenant_id, request.feature)) {
    return rate_limited_error(
        absl::StrCat("rate limit exceeded for tenant ", tenant_id, " on ",
                     request.feature));
  }

  auto feature = router_->resolve_feature(request.feature);
  if (!feature.ok()) {
    return feature.status();
  }

  if (admission_) {
    auto check = admission_->check_budget(
        feature->id, tenant_id, request.estimated_cost.value_or(0.0));
    if (!check.ok()) {
      return check.status();
    }
    if (!check->allowed) {
      return budget_exceeded_error(check->reason);
    }
  }

  auto response = router_->route_json(feature->id, request.params);
  if (!response.ok()) {
    LOG(WARNING) << "Route " << feature->id << " for tenant " << tenant_id
                 << " failed: " << response.status();
    return response.status();
  }

  if (admission_) {
    CostRecord record;
    record.request_id = response->request_id;
    record.feature = response->feature;
    record.provider =
        response->provider_type == provider_type_name(ProviderType::SELF_HOSTED)
            ? response->provider_type
            : response->provider_id;
    record.tenant_id = tenant_id;
    record.amount = response->cost;
    absl::Status status = admission_->record_cost(record);
    if (!status.ok()) {
      LOG(ERROR) << "Record cost of request " << response->request_id
                 << " failed: " << status;
    }
  }
  return response;
}

GatewayReply InferenceGateway::handle_http(const GatewayRequest& request) {
  return to_gateway_reply(handle(request));
}

GatewayReply to_gateway_reply(const absl::StatusOr<InferenceResponse>& result) {
  GatewayReply reply;
  if (result.ok()) {
    reply.status_code = 200;
    reply.body = result->to_json();
    return reply;
  }
  reply.status_code = http_status_code(result.status());
  reply.body = error_envelope(result.status());
  return reply;
}

}  // namespace ai_platform
