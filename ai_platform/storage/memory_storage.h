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

#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "common/macros.h"
#include "storage/storage.h"

namespace ai_platform {

// Process local stores. The server uses them when no database collaborator
// is wired in; tests use them to observe what components persisted.

class InMemoryServiceStore : public ServiceStore {
 public:
  InMemoryServiceStore() = default;
  ~InMemoryServiceStore() override = default;

  absl::Status upsert_service(const ServiceInstance& instance) override;

  absl::StatusOr<std::vector<ServiceInstance>> load_services() override;

  size_t size() const;

 private:
  DISALLOW_COPY_AND_ASSIGN(InMemoryServiceStore);

  mutable std::mutex mutex_;
  std::map<std::string, ServiceInstance> services_;
};

class InMemoryBudgetStore : public BudgetStore {
 public:
  // Keeps the newest `max_cost_records` cost records, dropping the oldest.
  explicit InMemoryBudgetStore(size_t max_cost_records = 10000);
  ~InMemoryBudgetStore() override = default;

  absl::StatusOr<std::vector<Budget>> load_budgets() override;

  absl::Status save_budget(const Budget& budget) override;

  absl::Status append_cost_record(const CostRecord& record,
                                  const std::string& cost_type) override;

  absl::Status upsert_daily_cost(const std::string& date,
                                 const std::string& scope,
                                 double delta) override;

  // Retained (record, cost type) pairs in append order.
  std::vector<std::pair<CostRecord, std::string>> cost_records() const;

  double daily_cost(const std::string& date, const std::string& scope) const;

 private:
  DISALLOW_COPY_AND_ASSIGN(InMemoryBudgetStore);

  const size_t max_cost_records_;

  mutable std::mutex mutex_;
  std::map<std::string, Budget> budgets_;
  std::deque<std::pair<CostRecord, std::string>> cost_records_;
  // (date, scope) -> accumulated cost
  std::map<std::pair<std::string, std::string>, double> daily_costs_;
};

class InMemoryConfigStore : public ConfigStore {
 public:
  InMemoryConfigStore() = default;
  ~InMemoryConfigStore() override = default;

  absl::StatusOr<Feature> get_feature(const std::string& id) override;

  absl::StatusOr<std::vector<Feature>> get_features_by_category(
      const std::string& category) override;

  // Replaces any feature with the same id.
  void put_feature(Feature feature);

  // Loads feature definitions from a JSON file, see parse_features().
  absl::Status load_file(const std::string& path);

  size_t size() const;

 private:
  DISALLOW_COPY_AND_ASSIGN(InMemoryConfigStore);

  mutable std::mutex mutex_;
  // kept in insertion order so category lookups are deterministic
  std::vector<Feature> features_;
  std::unordered_map<std::string, size_t> index_;
};

}  // namespace ai_platform
