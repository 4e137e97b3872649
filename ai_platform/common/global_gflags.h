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

#include <gflags/gflags.h>

DECLARE_int32(rpc_port);
DECLARE_int32(num_rpc_threads);

DECLARE_string(feature_config_file);

DECLARE_int32(heartbeat_interval_s);
DECLARE_int32(heartbeat_timeout_s);
DECLARE_int32(max_missed_heartbeats);
DECLARE_int32(health_check_interval_s);
DECLARE_double(degraded_error_rate);
DECLARE_int32(shutdown_grace_period_s);
DECLARE_int32(max_pending_config_updates);

DECLARE_int32(cost_sync_interval_s);
DECLARE_bool(seed_default_budgets);

DECLARE_int32(scale_check_interval_s);
DECLARE_double(scale_up_rps_ceiling);
DECLARE_string(default_namespace);

DECLARE_int32(provider_timeout_ms);
DECLARE_int32(default_rate_limit_per_minute);

DECLARE_int32(event_queue_capacity);
DECLARE_int32(persistence_threads);
