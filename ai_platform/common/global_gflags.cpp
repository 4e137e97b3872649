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

#include "common/global_gflags.h"

// rpc server
DEFINE_int32(rpc_port, 9900, "Port of the registration rpc server.");

DEFINE_int32(num_rpc_threads, 8, "Number of brpc worker threads.");

DEFINE_string(feature_config_file,
              "",
              "JSON file with the feature and provider definitions.");

// service registry
DEFINE_int32(heartbeat_interval_s,
             30,
             "Heartbeat interval handed to instances on registration.");

DEFINE_int32(heartbeat_timeout_s,
             90,
             "Silence after which a sweep counts a missed heartbeat.");

DEFINE_int32(max_missed_heartbeats,
             3,
             "Missed heartbeats before an instance is marked unhealthy.");

DEFINE_int32(health_check_interval_s,
             10,
             "Interval of the heartbeat timeout sweep.");

DEFINE_double(degraded_error_rate,
              0.10,
              "Error rate above which a heartbeat marks an instance degraded.");

DEFINE_int32(shutdown_grace_period_s,
             30,
             "Grace period returned to instances that request shutdown.");

DEFINE_int32(max_pending_config_updates,
             100,
             "Upper bound of config pushes waiting for a heartbeat.");

// budget
DEFINE_int32(cost_sync_interval_s,
             60,
             "Interval of the spending reconciliation into daily statistics.");

DEFINE_bool(seed_default_budgets,
            true,
            "Create the default budgets when the store holds none.");

// scaler
DEFINE_int32(scale_check_interval_s, 30, "Interval of the auto scaling loop.");

DEFINE_double(scale_up_rps_ceiling,
              100.0,
              "Requests per second above which a feature scales up.");

DEFINE_string(default_namespace,
              "ai-platform",
              "Cluster namespace used when a scale config names none.");

// routing
DEFINE_int32(provider_timeout_ms,
             60000,
             "Timeout handed to provider clients when the feature sets none.");

DEFINE_int32(default_rate_limit_per_minute,
             100,
             "Requests per minute allowed per tenant and feature by default.");

// event streams and async work
DEFINE_int32(event_queue_capacity,
             100,
             "Capacity of every watcher queue, newer events are dropped when "
             "a queue is full.");

DEFINE_int32(persistence_threads,
             2,
             "Threads used for fire-and-forget persistence.");
