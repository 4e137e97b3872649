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
#include <brpc/channel.h>

#include <deque>
#include <memory>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/clock.h"
#include "common/event_queue.h"
#include "common/macros.h"
#include "common/options.h"
#include "common/periodic_task.h"
#include "common/threadpool.h"
#include "common/types.h"
#include "storage/storage.h"

namespace ai_platform {

// Authoritative in-memory view of the self-hosted fleet.
//
// Instances register, then report liveness and metrics through heartbeats.
// Heartbeats drive Healthy <-> Degraded by error rate; only the timeout sweep
// marks an instance Unhealthy; only shutdown marks it Draining.
class ServiceRegistry final {
 public:
  ServiceRegistry(const Options& options,
                  std::shared_ptr<ServiceStore> store,
                  std::shared_ptr<Clock> clock = Clock::real());

  ~ServiceRegistry();

  // Rebuilds the index from the store. Terminated instances are skipped.
  absl::Status load_from_store();

  // Starts and stops the heartbeat timeout sweep.
  void start();
  void stop();

  // Re-registration of a known instance updates it in place and issues a new
  // token.
  absl::StatusOr<RegisterResponse> register_service(
      const RegisterRequest& request);

  absl::StatusOr<HeartbeatResponse> heartbeat(const HeartbeatRequest& request);

  absl::StatusOr<ShutdownResponse> shutdown(const ShutdownRequest& request);

  // Draining -> Terminated. The instance leaves the index afterwards.
  absl::Status mark_terminated(const std::string& service_id);

  absl::StatusOr<ServiceInstance> get_service(const std::string& service_id);

  ServiceList list_services(const ServiceFilter& filter);

  // Healthy instances only, for new request dispatch.
  std::vector<ServiceInstance> get_healthy_services(
      const std::string& service_type);

  // Healthy and Degraded instances.
  std::vector<ServiceInstance> get_services_by_type(
      const std::string& service_type);

  // HTTP channel to the instance, created on first use and kept until the
  // instance terminates. Null for unknown ids or when the channel fails to
  // initialize.
  std::shared_ptr<brpc::Channel> get_channel(const std::string& service_id);

  // Queues a config push, delivered with the instance's next heartbeat.
  absl::Status update_config(const std::string& service_id,
                             const nlohmann::json& config);

  // Best effort stream of accepted heartbeats. Close the queue to
  // unsubscribe.
  std::shared_ptr<BoundedQueue<HeartbeatEvent>> watch_heartbeats();

  // One sweep: counts a miss for every live instance whose last heartbeat is
  // older than the timeout, and marks it Unhealthy at the miss limit.
  // Returns the number of instances marked Unhealthy by this sweep.
  size_t check_heartbeat_timeout();

 private:
  DISALLOW_COPY_AND_ASSIGN(ServiceRegistry);

  // Fire and forget, failures are logged.
  void persist_async(ServiceInstance snapshot);

  HealthState health_after_heartbeat(const ServiceInstance& instance,
                                     const InstanceMetrics& metrics) const;

  void index_instance(const ServiceInstance& instance);

  void unindex_instance(const ServiceInstance& instance);

  std::shared_ptr<brpc::Channel> create_channel(const std::string& endpoint);

 private:
  Options options_;

  std::shared_ptr<ServiceStore> store_;
  std::shared_ptr<Clock> clock_;

  std::shared_mutex inst_mutex_;
  std::unordered_map<std::string, ServiceInstance> instances_;
  // service_type -> ids, in registration order
  std::unordered_map<std::string, std::vector<std::string>> type_index_;
  // service_id -> config pushes not yet delivered
  std::unordered_map<std::string, std::deque<ConfigUpdate>> pending_configs_;
  size_t pending_config_count_ = 0;

  // service_id -> channel, guarded by channel_mutex_
  std::shared_mutex channel_mutex_;
  std::unordered_map<std::string, std::shared_ptr<brpc::Channel>>
      cached_channels_;

  EventBroadcaster<HeartbeatEvent> heartbeat_events_;

  PeriodicTask health_check_task_;

  ThreadPool threadpool_;
};

}  // namespace ai_platform
