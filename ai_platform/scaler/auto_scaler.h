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

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/time/time.h>

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/clock.h"
#include "common/event_queue.h"
#include "common/macros.h"
#include "common/options.h"
#include "common/periodic_task.h"
#include "registry/service_registry.h"
#include "scaler/cluster_client.h"

namespace ai_platform {

enum class ScaleAction : int8_t {
  NONE = 0,
  SCALE_UP = 1,
  SCALE_DOWN = 2,
  SCALE_TO_ZERO = 3,
};

const char* scale_action_name(ScaleAction action);

struct ScaleConfig {
  std::string feature_id;
  int32_t min_instances = 0;
  int32_t max_instances = 1;
  // percent
  double target_cpu = 70.0;
  double target_memory = 0.0;
  int64_t target_queue_size = 0;
  int64_t idle_timeout_s = 600;
  int64_t scale_up_cooldown_s = 60;
  int64_t scale_down_cooldown_s = 300;
  absl::Time last_scale_up = absl::InfinitePast();
  absl::Time last_scale_down = absl::InfinitePast();
  // "<feature>-inference" when empty
  std::string deployment_name;
  std::string name_space;
};

struct ScaleMetrics {
  double cpu_usage = 0.0;
  double memory_usage = 0.0;
  double gpu_usage = 0.0;
  int64_t queue_size = 0;
  double requests_per_sec = 0.0;
  int64_t idle_time_s = 0;
};

struct ScaleDecision {
  std::string feature_id;
  ScaleAction action = ScaleAction::NONE;
  int32_t current_replicas = 0;
  int32_t target_replicas = 0;
  ScaleMetrics metrics;
  std::string reason;
};

struct ScaleEvent {
  std::string feature_id;
  ScaleAction action = ScaleAction::NONE;
  int32_t current = 0;
  int32_t target = 0;
  std::string reason;
  absl::Time timestamp = absl::UnixEpoch();
};

// text_to_image 0..5, image_editing 0..3, image_stylization 0..2.
std::vector<ScaleConfig> default_scale_configs(const std::string& name_space);

// Adjusts the replica count of each self-hosted feature deployment from the
// metrics its instances report through heartbeats.
//
// Every action moves by one replica, except scale to zero which goes from
// one straight to zero once the feature has been idle long enough. Actions
// of the same direction are separated by a cooldown.
class AutoScaler final {
 public:
  AutoScaler(const Options& options,
             std::shared_ptr<ServiceRegistry> registry,
             std::shared_ptr<ClusterClient> cluster,
             std::shared_ptr<Clock> clock = Clock::real());

  ~AutoScaler();

  void start();
  void stop();

  absl::StatusOr<ScaleDecision> check_scale(const std::string& feature_id);

  // check_scale() for every configured feature. Failures are logged. Returns
  // the number of actions taken.
  size_t run_scale_round();

  absl::Status update_scale_config(ScaleConfig config);

  absl::StatusOr<ScaleConfig> get_scale_config(const std::string& feature_id);

  // Sorted feature ids.
  std::vector<std::string> features();

  // Manual scale up by `count`, bounded by max_instances. No cooldown.
  absl::Status scale_up(const std::string& feature_id, int32_t count);

  absl::Status scale_to_zero(const std::string& feature_id);

  std::shared_ptr<BoundedQueue<ScaleEvent>> watch_scale_events();

 private:
  DISALLOW_COPY_AND_ASSIGN(AutoScaler);

  // Last activity and processed count seen for one feature.
  struct Activity {
    bool observed = false;
    absl::Time last_active = absl::UnixEpoch();
    absl::Time last_sample = absl::UnixEpoch();
    int64_t last_processed = 0;
  };

  ScaleMetrics observe(const std::string& feature_id,
                       const std::vector<ServiceInstance>& services,
                       absl::Time now);

  bool should_scale_up(const ScaleConfig& config,
                       const ScaleMetrics& metrics,
                       int32_t current) const;

  bool should_scale_down(const ScaleConfig& config,
                         const ScaleMetrics& metrics,
                         int32_t current) const;

  // Sets the replicas, then stamps the cooldown and publishes the event.
  absl::Status apply(const ScaleConfig& config,
                     ScaleAction action,
                     int32_t current,
                     int32_t target,
                     const std::string& reason);

 private:
  Options options_;

  std::shared_ptr<ServiceRegistry> registry_;
  std::shared_ptr<ClusterClient> cluster_;
  std::shared_ptr<Clock> clock_;

  std::shared_mutex mutex_;
  std::unordered_map<std::string, ScaleConfig> configs_;
  std::unordered_map<std::string, Activity> activities_;

  EventBroadcaster<ScaleEvent> scale_events_;

  PeriodicTask scale_task_;
};

}  // namespace ai_platform
