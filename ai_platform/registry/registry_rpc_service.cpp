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

#include "registry/registry_rpc_service.h"

#include <brpc/closure_guard.h>
#include <brpc/controller.h>
#include <glog/logging.h>

#include <nlohmann/json.hpp>
#include <string>

#include "common/errors.h"

namespace ai_platform {

namespace {

void set_failed(google::protobuf::RpcController* controller,
                const absl::Status& status) {
  auto* cntl = static_cast<brpc::Controller*>(controller);
  cntl->SetFailed(http_status_code(status),
                  "%s",
                  error_envelope(status).dump().c_str());
}

absl::Status to_register_request(const proto::RegisterRequest& pb,
                                 RegisterRequest* request) {
  request->service_type = pb.service_type();
  request->hostname = pb.hostname();
  request->ip_address = pb.ip_address();
  request->port = pb.port();
  request->version = pb.version();

  const auto& caps = pb.capabilities();
  request->capabilities.supported_models.assign(caps.supported_models().begin(),
                                                caps.supported_models().end());
  request->capabilities.supported_resolutions.assign(
      caps.supported_resolutions().begin(), caps.supported_resolutions().end());
  request->capabilities.supported_formats.assign(
      caps.supported_formats().begin(), caps.supported_formats().end());
  request->capabilities.supported_styles.assign(
      caps.supported_styles().begin(), caps.supported_styles().end());
  request->capabilities.max_batch_size = caps.max_batch_size();
  if (!caps.custom_json().empty()) {
    auto custom = nlohmann::json::parse(caps.custom_json(), nullptr, false);
    if (custom.is_discarded()) {
      return invalid_argument_error("capabilities.custom_json is not JSON");
    }
    request->capabilities.custom = std::move(custom);
  }

  request->resources.gpu_memory = pb.resources().gpu_memory();
  request->resources.gpu_count = pb.resources().gpu_count();
  request->resources.cpu = pb.resources().cpu();
  request->resources.memory = pb.resources().memory();

  request->performance.estimated_latency_ms =
      pb.performance().estimated_latency_ms();
  request->performance.throughput_per_minute =
      pb.performance().throughput_per_minute();
  request->performance.warmup_time_seconds =
      pb.performance().warmup_time_seconds();
  return absl::OkStatus();
}

HeartbeatRequest to_heartbeat_request(const proto::HeartbeatRequest& pb) {
  HeartbeatRequest request;
  request.service_id = pb.service_id();
  request.token = pb.token();
  request.timestamp = pb.timestamp();
  request.metrics.current_load = pb.current_load();
  request.metrics.queue_size = pb.queue_size();
  request.metrics.processed_count = pb.processed_count();
  request.metrics.error_count = pb.error_count();
  request.metrics.cpu_utilization = pb.cpu_utilization();
  request.metrics.gpu_utilization = pb.gpu_utilization();
  request.metrics.memory_usage = pb.memory_usage();
  return request;
}

}  // namespace

RegistryRpcService::RegistryRpcService(
    std::shared_ptr<ServiceRegistry> registry)
    : registry_(std::move(registry)) {}

void RegistryRpcService::Register(google::protobuf::RpcController* controller,
                                  const proto::RegisterRequest* request,
                                  proto::RegisterResponse* response,
                                  google::protobuf::Closure* done) {
  brpc::ClosureGuard done_guard(done);

  RegisterRequest register_request;
  absl::Status status = to_register_request(*request, &register_request);
  if (!status.ok()) {
    set_failed(controller, status);
    return;
  }

  auto result = registry_->register_service(register_request);
  if (!result.ok()) {
    LOG(ERROR) << "Register from " << request->hostname()
               << " failed: " << result.status();
    set_failed(controller, result.status());
    return;
  }
  response->set_service_id(result->service_id);
  response->set_heartbeat_interval_seconds(result->heartbeat_interval_seconds);
  response->set_config_version(result->config_version);
  response->set_token(result->token);
}

void RegistryRpcService::Heartbeat(google::protobuf::RpcController* controller,
                                   const proto::HeartbeatRequest* request,
                                   proto::HeartbeatResponse* response,
                                   google::protobuf::Closure* done) {
  brpc::ClosureGuard done_guard(done);

  auto result = registry_->heartbeat(to_heartbeat_request(*request));
  if (!result.ok()) {
    set_failed(controller, result.status());
    return;
  }
  response->set_status(result->status);
  response->set_drain_requested(result->drain_requested);
  if (result->config_update.has_value()) {
    auto* update = response->mutable_config_update();
    update->set_version(result->config_update->version);
    update->set_config_json(result->config_update->config.dump());
  }
}

void RegistryRpcService::Shutdown(google::protobuf::RpcController* controller,
                                  const proto::ShutdownRequest* request,
                                  proto::ShutdownResponse* response,
                                  google::protobuf::Closure* done) {
  brpc::ClosureGuard done_guard(done);

  ShutdownRequest shutdown_request;
  shutdown_request.service_id = request->service_id();
  shutdown_request.reason = request->reason();

  auto result = registry_->shutdown(shutdown_request);
  if (!result.ok()) {
    set_failed(controller, result.status());
    return;
  }
  response->set_grace_period_seconds(result->grace_period_seconds);
  response->set_message(result->message);
}

}  // namespace ai_platform
