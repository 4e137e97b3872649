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

#include <string>
#include <vector>

#include "budget/budget_types.h"
#include "common/feature_config.h"
#include "common/types.h"

namespace ai_platform {

// Durable copy of the registered fleet. The registry rebuilds its index from
// it at startup; heartbeats are authoritative afterwards.
class ServiceStore {
 public:
  virtual ~ServiceStore() = default;

  virtual absl::Status upsert_service(const ServiceInstance& instance) = 0;

  virtual absl::StatusOr<std::vector<ServiceInstance>> load_services() = 0;
};

class BudgetStore {
 public:
  virtual ~BudgetStore() = default;

  virtual absl::StatusOr<std::vector<Budget>> load_budgets() = 0;

  virtual absl::Status save_budget(const Budget& budget) = 0;

  // cost_type is "self_hosted" or "third_party_<provider>".
  virtual absl::Status append_cost_record(const CostRecord& record,
                                          const std::string& cost_type) = 0;

  // Adds `delta` to the statistics row keyed by (date, scope), creating it
  // when missing.
  virtual absl::Status upsert_daily_cost(const std::string& date,
                                         const std::string& scope,
                                         double delta) = 0;
};

// Read side of feature/provider configuration management.
class ConfigStore {
 public:
  virtual ~ConfigStore() = default;

  virtual absl::StatusOr<Feature> get_feature(const std::string& id) = 0;

  virtual absl::StatusOr<std::vector<Feature>> get_features_by_category(
      const std::string& category) = 0;
};

}  // namespace ai_platform
