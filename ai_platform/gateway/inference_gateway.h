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

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

#include "budget/admission_controller.h"
#include "common/macros.h"
#include "ratelimit/rate_limiter.h"
#include "router/routing_engine.h"

namespace ai_platform {

struct GatewayRequest {
  // feature id or category
  std::string feature;
  // "default" when empty
  std::string tenant_id;
  nlohmann::json params;
  // checked against every budget scope before dispatch, 0 when unset
  std::optional<double> estimated_cost;
};

struct GatewayReply {
  int status_code = 200;
  nlohmann::json body;
};

// Entry point of an inference request: admission, routing, accounting.
class InferenceGateway final {
 public:
  InferenceGateway(std::shared_ptr<RateLimiter> rate_limiter,
                   std::shared_ptr<AdmissionController> admission,
                   std::shared_ptr<RoutingEngine> router);

  ~InferenceGateway() = default;

  // Rate limit, then budget check, then route, then record the cost of a
  // successful call. A rejected request never reaches a provider.
  absl::StatusOr<InferenceResponse> handle(const GatewayRequest& request);

  // handle() rendered for the HTTP boundary: the response json with 200, or
  // the error envelope with the mapped status code.
  GatewayReply handle_http(const GatewayRequest& request);

 private:
  DISALLOW_COPY_AND_ASSIGN(InferenceGateway);

  std::shared_ptr<RateLimiter> rate_limiter_;
  std::shared_ptr<AdmissionController> admission_;
  std::shared_ptr<RoutingEngine> router_;
};

GatewayReply to_gateway_reply(const absl::StatusOr<InferenceResponse>& result);

}  // namespace ai_platform
