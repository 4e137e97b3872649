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

#include "common/macros.h"
#include "control_plane_rpc.pb.h"
#include "gateway/inference_gateway.h"

namespace ai_platform {

// Parses {"feature", "tenant_id", "params", "estimated_cost"} from a JSON
// body.
absl::StatusOr<GatewayRequest> parse_gateway_request(
    const nlohmann::json& body);

// POST /v1/inference over brpc http.
class InferenceHttpService : public proto::InferenceHttpService {
 public:
  explicit InferenceHttpService(std::shared_ptr<InferenceGateway> gateway);

  ~InferenceHttpService() override = default;

  void Infer(google::protobuf::RpcController* controller,
             const proto::HttpRequest* request,
             proto::HttpResponse* response,
             google::protobuf::Closure* done) override;

 private:
  DISALLOW_COPY_AND_ASSIGN(InferenceHttpService);

  std::shared_ptr<InferenceGateway> gateway_;
};

}  // namespace ai_platform
