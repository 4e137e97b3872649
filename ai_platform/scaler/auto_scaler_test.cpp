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

#include "scaler/auto_scaler.h"

#include <absl/strings/str_cat.h>
#include <gtest/gtest.h>

#include <memory>

#include "common/errors.h"
#include "testing/fakes.h"

namespace ai_platform {

namespace {

constexpr char kNamespace[] = "ai-platform";

class AutoScalerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    clock_ = std::make_shared<ManualClock>();
    registry_ = std::make_shared<ServiceRegistry>(Options(), nullptr, clock_);
    cluster_ = std::make_shared<testing::FlakyClusterClient>();
    cluster_->cluster.add_deployment("text_to_image-inference", kNamespace, 1);
    cluster_->cluster.add_deployment("image_editing-inference", kNamespace, 0);
    cluster_->cluster.add_deployment(
        "image_stylization-inference", kNamespace, 0);
    scaler_ = std::make_unique<AutoScaler>(Options(), registry_, cluster_,
                                           clock_);
  }

  int32_t replicas(const std::string& feature) {
    auto current = cluster_->cluster.get_replicas(
        absl::StrCat(feature, "-inference"), kNamespace);
    EXPECT_TRUE(current.ok()) << current.status();
    return current.ok() ? *current : -1;
  }

  void set_replicas(const std::string& feature, int32_t count) {
    ASSERT_TRUE(cluster_->cluster
                    .set_replicas(absl::StrCat(feature, "-inference"),
                                  kNamespace, count)
                    .ok());
  }

  // Registers a text_to_image instance and returns its credentials.
  RegisterResponse add_instance() {
    RegisterRequest request;
    request.service_type = "text_to_image";
    request.hostname = "gpu";
    request.ip_address = "10.0.0.1";
    request.port = 8000;
    auto registered = registry_->register_service(request);
    EXPECT_TRUE(registered.ok());
    return *registered;
  }

  void report(const RegisterResponse& instance, const InstanceMetrics& m) {
    HeartbeatRequest heartbeat;
    heartbeat.service_id = instance.service_id;
    heartbeat.token = instance.token;
    heartbeat.metrics = m;
    ASSERT_TRUE(registry_->heartbeat(heartbeat).ok());
  }

  InstanceMetrics busy_metrics(double cpu) {
    InstanceMetrics metrics;
    metrics.cpu_utilization = cpu;
    metrics.current_load = 0.9;
    return metrics;
  }

  std::shared_ptr<ManualClock> clock_;
  std::shared_ptr<ServiceRegistry> registry_;
  std::shared_ptr<testing::FlakyClusterClient> cluster_;
  std::unique_ptr<AutoScaler> scaler_;
};

}  // namespace

TEST(ScaleConfigTest, DefaultConfigs) {
  auto configs = default_scale_configs("prod");
  ASSERT_EQ(configs.size(), 3u);
  EXPECT_EQ(configs[0].feature_id, "text_to_image");
  EXPECT_EQ(configs[0].max_instances, 5);
  EXPECT_EQ(configs[0].target_queue_size, 50);
  EXPECT_EQ(configs[0].idle_timeout_s, 900);
  EXPECT_EQ(configs[0].deployment_name, "text_to_image-inference");
  EXPECT_EQ(configs[0].name_space, "prod");
  EXPECT_EQ(configs[1].max_instances, 3);
  EXPECT_EQ(configs[2].max_instances, 2);
  for (const auto& config : configs) {
    EXPECT_EQ(config.min_instances, 0);
    EXPECT_EQ(config.scale_up_cooldown_s, 60);
    EXPECT_EQ(config.scale_down_cooldown_s, 300);
  }
  EXPECT_STREQ(scale_action_name(ScaleAction::SCALE_TO_ZERO),
               "scale_to_zero");
}

TEST_F(AutoScalerTest, ScalesUpOnHighCpuWithCooldown) {
  RegisterResponse instance = add_instance();
  report(instance, busy_metrics(90));

  auto decision = scaler_->check_scale("text_to_image");
  ASSERT_TRUE(decision.ok()) << decision.status();
  EXPECT_EQ(decision->action, ScaleAction::SCALE_UP);
  EXPECT_EQ(decision->current_replicas, 1);
  EXPECT_EQ(decision->target_replicas, 2);
  EXPECT_DOUBLE_EQ(decision->metrics.cpu_usage, 90);
  EXPECT_EQ(replicas("text_to_image"), 2);

  decision = scaler_->check_scale("text_to_image");
  ASSERT_TRUE(decision.ok());
  EXPECT_EQ(decision->action, ScaleAction::NONE);
  EXPECT_EQ(decision->reason, "scale up cooldown");
  EXPECT_EQ(replicas("text_to_image"), 2);

  clock_->advance(absl::Seconds(61));
  decision = scaler_->check_scale("text_to_image");
  ASSERT_TRUE(decision.ok());
  EXPECT_EQ(decision->action, ScaleAction::SCALE_UP);
  EXPECT_EQ(replicas("text_to_image"), 3);
}

TEST_F(AutoScalerTest, ScalesUpOnQueueDepth) {
  RegisterResponse instance = add_instance();
  InstanceMetrics metrics = busy_metrics(10);
  metrics.queue_size = 60;
  report(instance, metrics);

  auto decision = scaler_->check_scale("text_to_image");
  ASSERT_TRUE(decision.ok());
  EXPECT_EQ(decision->action, ScaleAction::SCALE_UP);
  EXPECT_EQ(decision->metrics.queue_size, 60);
}

TEST_F(AutoScalerTest, NeverExceedsMaxInstances) {
  set_replicas("text_to_image", 5);
  RegisterResponse instance = add_instance();
  report(instance, busy_metrics(95));

  auto decision = scaler_->check_scale("text_to_image");
  ASSERT_TRUE(decision.ok());
  EXPECT_EQ(decision->action, ScaleAction::NONE);
  EXPECT_EQ(decision->reason, "no scale needed");
  EXPECT_EQ(replicas("text_to_image"), 5);
}

TEST_F(AutoScalerTest, ScalesToZeroAfterIdleTimeout) {
  auto events = scaler_->watch_scale_events();

  auto decision = scaler_->check_scale("text_to_image");
  ASSERT_TRUE(decision.ok());
  EXPECT_EQ(decision->action, ScaleAction::NONE);
  EXPECT_EQ(decision->reason, "idle for 0s, waiting for idle timeout");

  clock_->advance(absl::Seconds(900));
  decision = scaler_->check_scale("text_to_image");
  ASSERT_TRUE(decision.ok());
  EXPECT_EQ(decision->action, ScaleAction::SCALE_TO_ZERO);
  EXPECT_EQ(decision->target_replicas, 0);
  EXPECT_EQ(decision->metrics.idle_time_s, 900);
  EXPECT_EQ(replicas("text_to_image"), 0);

  ScaleEvent event;
  ASSERT_TRUE(events->try_pop(&event));
  EXPECT_EQ(event.feature_id, "text_to_image");
  EXPECT_EQ(event.action, ScaleAction::SCALE_TO_ZERO);
  EXPECT_EQ(event.current, 1);
  EXPECT_EQ(event.target, 0);
  EXPECT_EQ(event.timestamp, clock_->now());
}

TEST_F(AutoScalerTest, ScaleDownStopsAtMinInstances) {
  ScaleConfig config = *scaler_->get_scale_config("text_to_image");
  config.min_instances = 1;
  ASSERT_TRUE(scaler_->update_scale_config(config).ok());
  set_replicas("text_to_image", 2);

  auto decision = scaler_->check_scale("text_to_image");
  ASSERT_TRUE(decision.ok());
  EXPECT_EQ(decision->action, ScaleAction::SCALE_DOWN);
  EXPECT_EQ(decision->target_replicas, 1);
  EXPECT_EQ(replicas("text_to_image"), 1);

  clock_->advance(absl::Hours(2));
  decision = scaler_->check_scale("text_to_image");
  ASSERT_TRUE(decision.ok());
  EXPECT_EQ(decision->action, ScaleAction::NONE);
  EXPECT_EQ(replicas("text_to_image"), 1);
}

TEST_F(AutoScalerTest, ScaleDownHasCooldown) {
  set_replicas("text_to_image", 4);

  auto decision = scaler_->check_scale("text_to_image");
  ASSERT_TRUE(decision.ok());
  EXPECT_EQ(decision->action, ScaleAction::SCALE_DOWN);
  EXPECT_EQ(replicas("text_to_image"), 3);

  clock_->advance(absl::Seconds(120));
  decision = scaler_->check_scale("text_to_image");
  ASSERT_TRUE(decision.ok());
  EXPECT_EQ(decision->reason, "scale down cooldown");
  EXPECT_EQ(replicas("text_to_image"), 3);

  clock_->advance(absl::Seconds(181));
  decision = scaler_->check_scale("text_to_image");
  ASSERT_TRUE(decision.ok());
  EXPECT_EQ(decision->action, ScaleAction::SCALE_DOWN);
  EXPECT_EQ(replicas("text_to_image"), 2);
}

TEST_F(AutoScalerTest, ProcessedRequestsResetIdleTime) {
  RegisterResponse instance = add_instance();
  InstanceMetrics metrics;
  report(instance, metrics);
  ASSERT_TRUE(scaler_->check_scale("text_to_image").ok());

  clock_->advance(absl::Seconds(600));
  metrics.processed_count = 100;
  report(instance, metrics);
  auto decision = scaler_->check_scale("text_to_image");
  ASSERT_TRUE(decision.ok());
  EXPECT_EQ(decision->metrics.idle_time_s, 0);
  EXPECT_NEAR(decision->metrics.requests_per_sec, 100.0 / 600.0, 1e-9);
  EXPECT_EQ(decision->action, ScaleAction::NONE);

  // 200 requests within a second is above the default ceiling
  clock_->advance(absl::Seconds(1));
  metrics.processed_count = 300;
  report(instance, metrics);
  decision = scaler_->check_scale("text_to_image");
  ASSERT_TRUE(decision.ok());
  EXPECT_DOUBLE_EQ(decision->metrics.requests_per_sec, 200);
  EXPECT_EQ(decision->action, ScaleAction::SCALE_UP);
}

TEST_F(AutoScalerTest, FailedReplicaUpdateKeepsCooldownClear) {
  RegisterResponse instance = add_instance();
  report(instance, busy_metrics(90));
  cluster_->fail_set = true;

  auto decision = scaler_->check_scale("text_to_image");
  ASSERT_FALSE(decision.ok());
  EXPECT_EQ(error_kind(decision.status()), ErrorKind::kUnavailable);
  EXPECT_EQ(scaler_->get_scale_config("text_to_image")->last_scale_up,
            absl::InfinitePast());
  EXPECT_EQ(scaler_->run_scale_round(), 0u);

  cluster_->fail_set = false;
  decision = scaler_->check_scale("text_to_image");
  ASSERT_TRUE(decision.ok());
  EXPECT_EQ(decision->action, ScaleAction::SCALE_UP);
}

TEST_F(AutoScalerTest, UnknownFeatureOrDeployment) {
  EXPECT_EQ(error_kind(scaler_->check_scale("video").status()),
            ErrorKind::kNotFound);

  ScaleConfig config;
  config.feature_id = "text_generation";
  config.max_instances = 2;
  ASSERT_TRUE(scaler_->update_scale_config(config).ok());
  EXPECT_EQ(scaler_->get_scale_config("text_generation")->deployment_name,
            "text_generation-inference");
  EXPECT_EQ(error_kind(scaler_->check_scale("text_generation").status()),
            ErrorKind::kNotFound);
}

TEST_F(AutoScalerTest, UpdateScaleConfigValidatesBounds) {
  ScaleConfig config;
  config.feature_id = "text_to_image";
  config.min_instances = 3;
  config.max_instances = 2;
  EXPECT_EQ(error_kind(scaler_->update_scale_config(config)),
            ErrorKind::kInvalidArgument);

  config.feature_id.clear();
  config.max_instances = 4;
  EXPECT_EQ(error_kind(scaler_->update_scale_config(config)),
            ErrorKind::kInvalidArgument);
}

TEST_F(AutoScalerTest, ManualScaleUpIsBoundedByMax) {
  EXPECT_EQ(error_kind(scaler_->scale_up("text_to_image", 0)),
            ErrorKind::kInvalidArgument);

  ASSERT_TRUE(scaler_->scale_up("text_to_image", 10).ok());
  EXPECT_EQ(replicas("text_to_image"), 5);

  const size_t calls = cluster_->cluster.set_replicas_calls();
  ASSERT_TRUE(scaler_->scale_up("text_to_image", 1).ok());
  EXPECT_EQ(cluster_->cluster.set_replicas_calls(), calls);
}

TEST_F(AutoScalerTest, ManualScaleToZero) {
  set_replicas("image_editing", 2);
  ASSERT_TRUE(scaler_->scale_to_zero("image_editing").ok());
  EXPECT_EQ(replicas("image_editing"), 0);
  EXPECT_EQ(error_kind(scaler_->scale_to_zero("video")),
            ErrorKind::kNotFound);
}

TEST_F(AutoScalerTest, ScaleRoundCountsActions) {
  RegisterResponse instance = add_instance();
  report(instance, busy_metrics(90));
  set_replicas("image_editing", 3);

  EXPECT_EQ(scaler_->features(),
            (std::vector<std::string>{"image_editing", "image_stylization",
                                      "text_to_image"}));
  // text_to_image scales up and image_editing scales down
  EXPECT_EQ(scaler_->run_scale_round(), 2u);
  EXPECT_EQ(replicas("text_to_image"), 2);
  EXPECT_EQ(replicas("image_editing"), 2);
}

}  // namespace ai_platform
