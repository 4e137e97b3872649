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

#include "gateway/inference_http_service.h"

#include <brpc/closure_guard.h>
#include <brpc/controller.h>
#include <glog/logging.h>

#include <string>
#include <utility>

#include "common/errors.h"

namespace ai_platform {

namespace {

void write_reply(brpc::Controller* cntl, const GatewayReply& reply) {
  cntl->http_response().set_status_code(reply.status_code);
  cntl->http_response().set_content_type("application/json");
  cntl->response_attachment().append(reply.body.dump());
}

}  // namespace

absl::StatusOr<GatewayRequest> parse_gateway_request(
    const nlohmann::json& body) {
  if (!body.is_object()) {
    return invalid_argument_error("request body must be a JSON object");
  }
  GatewayRequest request;
  auto feature = body.find("feature");
  if (feature == body.end() || !feature->is_string()) {
    return invalid_argument_error("feature is required");
  }
  request.feature = feature->get<std::string>();

  auto tenant = body.find("tenant_id");
  if (tenant != body.end()) {
    if (!tenant->is_string()) {
      return invalid_argument_error("tenant_id must be a string");
    }
    request.tenant_id = tenant->get<std::string>();
  }

  auto params = body.find("params");
  request.params = params == body.end() ? nlohmann::json::object() : *params;

  auto cost = body.find("estimated_cost");
  if (cost != body.end() && !cost->is_null()) {
    if (!cost->is_number()) {
      return invalid_argument_error("estimated_cost must be a number");
    }
    request.estimated_cost = cost->get<double>();
  }
  return request;
}

InferenceHttpService::InferenceHttpService(
    std::shared_ptr<InferenceGateway> gateway)
    : gateway_(std::move(gateway)) {}

void InferenceHttpService::Infer(google::protobuf::RpcController* controller,
                                 const proto::HttpRequest* request,
                                 proto::HttpResponse* response,
                                 google::protobuf::Closure* done) {
  brpc::ClosureGuard done_guard(done);
  auto* cntl = static_cast<brpc::Controller*>(controller);

  if (cntl->http_request().method() != brpc::HTTP_METHOD_POST) {
    absl::Status status = invalid_argument_error("only POST is supported");
    write_reply(cntl, {http_status_code(status), error_envelope(status)});
    return;
  }

  const std::string body = cntl->request_attachment().to_string();
  auto json = nlohmann::json::parse(body, nullptr, false);
  if (json.is_discarded()) {
    absl::Status status = invalid_argument_error("request body is not JSON");
    write_reply(cntl, {http_status_code(status), error_envelope(status)});
    return;
  }
  auto gateway_request = parse_gateway_request(json);
  if (!gateway_request.ok()) {
    write_reply(cntl,
                {http_status_code(gateway_request.status()),
                 error_envelope(gateway_request.status())});
    return;
  }

  GatewayReply reply = gateway_->handle_http(*gateway_request);
  VLOG(1) << "Inference of " << gateway_request->feature << " from "
          << cntl->remote_side() << " answered " << reply.status_code;
  write_reply(cntl, reply);
}

}  // namespace ai_platform
