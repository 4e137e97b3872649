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

#include "common/options.h"

#include <absl/strings/str_format.h>

#include "common/global_gflags.h"

namespace ai_platform {

Options Options::from_flags() {
  Options options;
  options.heartbeat_interval_s(FLAGS_heartbeat_interval_s)
      .heartbeat_timeout_s(FLAGS_heartbeat_timeout_s)
      .max_missed_heartbeats(FLAGS_max_missed_heartbeats)
      .health_check_interval_s(FLAGS_health_check_interval_s)
      .degraded_error_rate(FLAGS_degraded_error_rate)
      .shutdown_grace_period_s(FLAGS_shutdown_grace_period_s)
      .max_pending_config_updates(FLAGS_max_pending_config_updates)
      .cost_sync_interval_s(FLAGS_cost_sync_interval_s)
      .seed_default_budgets(FLAGS_seed_default_budgets)
      .scale_check_interval_s(FLAGS_scale_check_interval_s)
      .scale_up_rps_ceiling(FLAGS_scale_up_rps_ceiling)
      .default_namespace(FLAGS_default_namespace)
      .provider_timeout_ms(FLAGS_provider_timeout_ms)
      .default_rate_limit_per_minute(FLAGS_default_rate_limit_per_minute)
      .event_queue_capacity(FLAGS_event_queue_capacity)
      .persistence_threads(FLAGS_persistence_threads);
  return options;
}

std::string Options::to_string() const {
  return absl::StrFormat(
      "Options(heartbeat_interval_s=%d, heartbeat_timeout_s=%d, "
      "max_missed_heartbeats=%d, health_check_interval_s=%d, "
      "degraded_error_rate=%.2f, shutdown_grace_period_s=%d, "
      "cost_sync_interval_s=%d, scale_check_interval_s=%d, "
      "scale_up_rps_ceiling=%.1f, default_namespace=%s, "
      "provider_timeout_ms=%d, default_rate_limit_per_minute=%d, "
      "event_queue_capacity=%d, persistence_threads=%d)",
      heartbeat_interval_s_,
      heartbeat_timeout_s_,
      max_missed_heartbeats_,
      health_check_interval_s_,
      degraded_error_rate_,
      shutdown_grace_period_s_,
      cost_sync_interval_s_,
      scale_check_interval_s_,
      scale_up_rps_ceiling_,
      default_namespace_,
      provider_timeout_ms_,
      default_rate_limit_per_minute_,
      event_queue_capacity_,
      persistence_threads_);
}

}  // namespace ai_platform
