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

#include <brpc/controller.h>
#include <gtest/gtest.h>

#include <memory>

#include "common/clock.h"
#include "storage/memory_storage.h"

namespace ai_platform {

namespace {

class RegistryRpcServiceTest : public ::testing::Test {
 protected:
  RegistryRpcServiceTest()
      : registry_(std::make_shared<ServiceRegistry>(
            Options(),
            std::make_shared<InMemoryServiceStore>(),
            std::make_shared<ManualClock>())),
        service_(registry_) {}

  proto::RegisterResponse register_instance() {
    proto::RegisterRequest request;
    request.set_service_type("text_to_image");
    request.set_hostname("gpu-node");
    request.set_ip_address("10.0.0.7");
    request.set_port(9000);
    request.mutable_capabilities()->add_supported_models("sdxl");

    brpc::Controller cntl;
    proto::RegisterResponse response;
    service_.Register(&cntl, &request, &response, nullptr);
    EXPECT_FALSE(cntl.Failed()) << cntl.ErrorText();
    return response;
  }

  std::shared_ptr<ServiceRegistry> registry_;
  RegistryRpcService service_;
};

}  // namespace

TEST_F(RegistryRpcServiceTest, RegisterReturnsCredentials) {
  proto::RegisterResponse response = register_instance();
  EXPECT_FALSE(response.service_id().empty());
  EXPECT_EQ(response.token().size(), 32u);
  EXPECT_EQ(response.heartbeat_interval_seconds(), 30);

  auto instance = registry_->get_service(response.service_id());
  ASSERT_TRUE(instance.ok());
  EXPECT_EQ(instance->endpoint(), "10.0.0.7:9000");
  ASSERT_EQ(instance->capabilities.supported_models.size(), 1u);
}

TEST_F(RegistryRpcServiceTest, RegisterRejectsMalformedCapabilities) {
  proto::RegisterRequest request;
  request.set_service_type("text_to_image");
  request.set_hostname("gpu-node");
  request.set_port(9000);
  request.mutable_capabilities()->set_custom_json("{not json");

  brpc::Controller cntl;
  proto::RegisterResponse response;
  service_.Register(&cntl, &request, &response, nullptr);
  ASSERT_TRUE(cntl.Failed());
  EXPECT_EQ(cntl.ErrorCode(), 400);
}

TEST_F(RegistryRpcServiceTest, HeartbeatMapsErrorsToStatusCodes) {
  proto::RegisterResponse registered = register_instance();

  proto::HeartbeatRequest request;
  request.set_service_id(registered.service_id());
  request.set_token("forged");
  {
    brpc::Controller cntl;
    proto::HeartbeatResponse response;
    service_.Heartbeat(&cntl, &request, &response, nullptr);
    ASSERT_TRUE(cntl.Failed());
    EXPECT_EQ(cntl.ErrorCode(), 401);
  }

  request.set_service_id("text_to_image-00000000");
  {
    brpc::Controller cntl;
    proto::HeartbeatResponse response;
    service_.Heartbeat(&cntl, &request, &response, nullptr);
    ASSERT_TRUE(cntl.Failed());
    EXPECT_EQ(cntl.ErrorCode(), 404);
  }
}

TEST_F(RegistryRpcServiceTest, HeartbeatCarriesConfigAndDrain) {
  proto::RegisterResponse registered = register_instance();
  ASSERT_TRUE(registry_
                  ->update_config(registered.service_id(),
                                  nlohmann::json{{"steps", 30}})
                  .ok());

  proto::HeartbeatRequest request;
  request.set_service_id(registered.service_id());
  request.set_token(registered.token());
  request.set_processed_count(10);
  {
    brpc::Controller cntl;
    proto::HeartbeatResponse response;
    service_.Heartbeat(&cntl, &request, &response, nullptr);
    ASSERT_FALSE(cntl.Failed()) << cntl.ErrorText();
    EXPECT_EQ(response.status(), "healthy");
    EXPECT_FALSE(response.drain_requested());
    ASSERT_TRUE(response.has_config_update());
    auto config = nlohmann::json::parse(response.config_update().config_json());
    EXPECT_EQ(config["steps"], 30);
  }

  proto::ShutdownRequest shutdown;
  shutdown.set_service_id(registered.service_id());
  shutdown.set_reason("maintenance");
  {
    brpc::Controller cntl;
    proto::ShutdownResponse response;
    service_.Shutdown(&cntl, &shutdown, &response, nullptr);
    ASSERT_FALSE(cntl.Failed()) << cntl.ErrorText();
    EXPECT_EQ(response.grace_period_seconds(), 30);
  }
  {
    brpc::Controller cntl;
    proto::HeartbeatResponse response;
    service_.Heartbeat(&cntl, &request, &response, nullptr);
    ASSERT_FALSE(cntl.Failed()) << cntl.ErrorText();
    EXPECT_EQ(response.status(), "draining");
    EXPECT_TRUE(response.drain_requested());
  }
}

}  // namespace ai_platform
