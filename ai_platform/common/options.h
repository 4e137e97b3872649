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

#include <cstdint>
#include <string>

#include "common/macros.h"

namespace ai_platform {

class Options {
 public:
  Options() = default;
  ~Options() = default;

  // Builds options from the command line flags in global_gflags.h.
  static Options from_flags();

  std::string to_string() const;

  // service registry
  PROPERTY(int32_t, heartbeat_interval_s) = 30;
  PROPERTY(int32_t, heartbeat_timeout_s) = 90;
  PROPERTY(int32_t, max_missed_heartbeats) = 3;
  PROPERTY(int32_t, health_check_interval_s) = 10;
  PROPERTY(double, degraded_error_rate) = 0.10;
  PROPERTY(int32_t, shutdown_grace_period_s) = 30;
  PROPERTY(int32_t, max_pending_config_updates) = 100;

  // budget
  PROPERTY(int32_t, cost_sync_interval_s) = 60;
  PROPERTY(bool, seed_default_budgets) = true;

  // scaler
  PROPERTY(int32_t, scale_check_interval_s) = 30;
  PROPERTY(double, scale_up_rps_ceiling) = 100.0;
  PROPERTY(std::string, default_namespace) = "ai-platform";

  // routing
  PROPERTY(int32_t, provider_timeout_ms) = 60000;

  // rate limiting
  PROPERTY(int32_t, default_rate_limit_per_minute) = 100;

  // event streams and async work
  PROPERTY(int32_t, event_queue_capacity) = 100;
  PROPERTY(int32_t, persistence_threads) = 2;
};

}  // namespace ai_platform
