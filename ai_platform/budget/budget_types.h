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

#include <optional>
#include <string>
#include <vector>

namespace ai_platform {

// Budget scopes, and the id prefixes derived from them.
inline constexpr char kGlobalScope[] = "global";
inline constexpr char kServiceScope[] = "service";
inline constexpr char kTenantScope[] = "tenant";

struct AlertThreshold {
  // fraction of the budget, 0.7 == 70%
  double at = 0.0;
  // notify, switch_to_third_party, block
  std::string action;
  bool enabled = true;
};

// Spend ceiling of one scope. Ids are "global", "service:<feature>" and
// "tenant:<tenant id>".
struct Budget {
  std::string id;
  std::string name;
  std::string type;
  std::string target_id;
  double amount = 0.0;
  // daily, weekly, monthly
  std::string period;
  absl::Time period_start = absl::UnixEpoch();
  std::vector<AlertThreshold> alerts;
  absl::Time created_at = absl::UnixEpoch();
  absl::Time updated_at = absl::UnixEpoch();
};

// Accumulated spend of one scope. Only ever grows.
struct Spending {
  std::string budget_id;
  double amount = 0.0;
  absl::Time period_start = absl::UnixEpoch();
};

struct CostRecord {
  std::string id;
  std::string request_id;
  std::string feature;
  // "self_hosted" or the third party provider id
  std::string provider;
  std::string tenant_id;
  double amount = 0.0;
  absl::Time timestamp = absl::UnixEpoch();
};

struct BudgetInfo {
  double total = 0.0;
  double used = 0.0;
  double remaining = 0.0;
  double percentage = 0.0;
};

struct BudgetCheckResult {
  bool allowed = true;
  std::string reason;
  std::optional<BudgetInfo> global_budget;
  std::optional<BudgetInfo> service_budget;
  std::optional<BudgetInfo> tenant_budget;
};

struct BudgetAlert {
  std::string budget_id;
  std::string budget_name;
  // warning, critical
  std::string type;
  double used_amount = 0.0;
  double total_amount = 0.0;
  double percentage = 0.0;
  absl::Time timestamp = absl::UnixEpoch();
};

struct BudgetFilter {
  std::string type;
  std::string target_id;
};

}  // namespace ai_platform
