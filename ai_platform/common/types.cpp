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

#include "common/types.h"

#include <absl/strings/str_cat.h>

namespace ai_platform {

const char* health_state_name(HealthState state) {
  switch (state) {
    case HealthState::HEALTHY:
      return "healthy";
    case HealthState::DEGRADED:
      return "degraded";
    case HealthState::UNHEALTHY:
      return "unhealthy";
    case HealthState::DRAINING:
      return "draining";
    case HealthState::TERMINATED:
      return "terminated";
  }
  return "unknown";
}

bool parse_health_state(const std::string& name, HealthState* state) {
  static const std::map<std::string, HealthState> kStates = {
      {"healthy", HealthState::HEALTHY},
      {"degraded", HealthState::DEGRADED},
      {"unhealthy", HealthState::UNHEALTHY},
      {"draining", HealthState::DRAINING},
      {"terminated", HealthState::TERMINATED},
  };
  auto it = kStates.find(name);
  if (it == kStates.end()) {
    return false;
  }
  *state = it->second;
  return true;
}

std::string ServiceInstance::endpoint() const {
  const std::string& host = ip_address.empty() ? hostname : ip_address;
  return absl::StrCat(host, ":", port);
}

}  // namespace ai_platform
