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

#include <absl/time/time.h>

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace ai_platform {

// Healthy <-> Degraded       heartbeat error rate
// Healthy/Degraded -> Unhealthy  heartbeat timeout sweep
// * -> Draining              explicit shutdown
// Draining -> Terminated     external confirmation, absorbing
enum class HealthState : int8_t {
  HEALTHY = 0,
  DEGRADED = 1,
  UNHEALTHY = 2,
  DRAINING = 3,
  TERMINATED = 4,
};

const char* health_state_name(HealthState state);

bool parse_health_state(const std::string& name, HealthState* state);

struct ServiceCapabilities {
  std::vector<std::string> supported_models;
  std::vector<std::string> supported_resolutions;
  std::vector<std::string> supported_formats;
  std::vector<std::string> supported_styles;
  int32_t max_batch_size = 0;
  nlohmann::json custom;
};

struct ResourceSpec {
  std::string gpu_memory;
  int32_t gpu_count = 0;
  std::string cpu;
  std::string memory;
};

struct PerformanceSpec {
  int32_t estimated_latency_ms = 0;
  int32_t throughput_per_minute = 0;
  int32_t warmup_time_seconds = 0;
};

// Live metrics reported by each heartbeat. Counters are cumulative since the
// instance started.
struct InstanceMetrics {
  double current_load = 0.0;
  int32_t queue_size = 0;
  int64_t processed_count = 0;
  int64_t error_count = 0;
  double cpu_utilization = 0.0;
  double gpu_utilization = 0.0;
  int64_t memory_usage = 0;
};

struct ServiceInstance {
  std::string id;
  std::string service_type;
  std::string version;
  std::string hostname;
  std::string ip_address;
  int32_t port = 0;

  ServiceCapabilities capabilities;
  ResourceSpec resources;
  PerformanceSpec performance;

  HealthState state = HealthState::HEALTHY;
  absl::Time last_heartbeat = absl::UnixEpoch();
  int32_t heartbeat_missed = 0;

  InstanceMetrics metrics;

  // heartbeat credential issued on the latest registration
  std::string token;
  std::map<std::string, std::string> metadata;

  absl::Time started_at = absl::UnixEpoch();
  absl::Time registered_at = absl::UnixEpoch();
  absl::Time updated_at = absl::UnixEpoch();

  // "ip:port", or "hostname:port" when no ip was registered.
  std::string endpoint() const;
};

struct RegisterRequest {
  std::string service_type;
  ServiceCapabilities capabilities;
  ResourceSpec resources;
  PerformanceSpec performance;
  std::string hostname;
  std::string ip_address;
  int32_t port = 0;
  std::string version;
};

struct RegisterResponse {
  std::string service_id;
  int32_t heartbeat_interval_seconds = 0;
  std::string config_version;
  std::string token;
};

struct HeartbeatRequest {
  std::string service_id;
  std::string token;
  std::string timestamp;
  InstanceMetrics metrics;
};

// Out-of-band configuration pushed to one instance.
struct ConfigUpdate {
  std::string version;
  nlohmann::json config;
};

struct HeartbeatResponse {
  // one of "healthy", "degraded", "draining"
  std::string status;
  std::optional<ConfigUpdate> config_update;
  bool drain_requested = false;
  std::string message;
};

struct ShutdownRequest {
  std::string service_id;
  std::string reason;
};

struct ShutdownResponse {
  int32_t grace_period_seconds = 0;
  std::string message;
};

struct ServiceFilter {
  std::string service_type;
  std::optional<HealthState> state;
};

struct ServiceList {
  std::vector<ServiceInstance> services;
  int32_t total_count = 0;
  int32_t healthy_count = 0;
  int32_t degraded_count = 0;
  int32_t unhealthy_count = 0;
};

// Published on every accepted heartbeat.
struct HeartbeatEvent {
  std::string service_id;
  std::string service_type;
  HealthState state = HealthState::HEALTHY;
  InstanceMetrics metrics;
  absl::Time timestamp = absl::UnixEpoch();
};

}  // namespace ai_platform
