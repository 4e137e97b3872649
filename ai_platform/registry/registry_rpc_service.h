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

#include <memory>

#include "common/macros.h"
#include "control_plane_rpc.pb.h"
#include "registry/service_registry.h"

namespace ai_platform {

// brpc front of the ServiceRegistry for instance agents. Failures are set on
// the controller with the HTTP status class of the error kind.
class RegistryRpcService : public proto::ServiceRegistryRpc {
 public:
  explicit RegistryRpcService(std::shared_ptr<ServiceRegistry> registry);

  ~RegistryRpcService() override = default;

  void Register(google::protobuf::RpcController* controller,
                const proto::RegisterRequest* request,
                proto::RegisterResponse* response,
                google::protobuf::Closure* done) override;

  void Heartbeat(google::protobuf::RpcController* controller,
                 const proto::HeartbeatRequest* request,
                 proto::HeartbeatResponse* response,
                 google::protobuf::Closure* done) override;

  void Shutdown(google::protobuf::RpcController* controller,
                const proto::ShutdownRequest* request,
                proto::ShutdownResponse* response,
                google::protobuf::Closure* done) override;

 private:
  DISALLOW_COPY_AND_ASSIGN(RegistryRpcService);

  std::shared_ptr<ServiceRegistry> registry_;
};

}  // namespace ai_platform
