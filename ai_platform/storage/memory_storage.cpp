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

#include "storage/memory_storage.h"

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include <fstream>
#include <nlohmann/json.hpp>

#include "common/errors.h"

namespace ai_platform {

absl::Status InMemoryServiceStore::upsert_service(
    const ServiceInstance& instance) {
  std::lock_guard<std::mutex> lock(mutex_);
  services_.insert_or_assign(instance.id, instance);
  return absl::OkStatus();
}

absl::StatusOr<std::vector<ServiceInstance>>
InMemoryServiceStore::load_services() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ServiceInstance> services;
  services.reserve(services_.size());
  for (const auto& it : services_) {
    services.emplace_back(it.second);
  }
  return services;
}

size_t InMemoryServiceStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return services_.size();
}

InMemoryBudgetStore::InMemoryBudgetStore(size_t max_cost_records)
    : max_cost_records_(max_cost_records) {}

absl::StatusOr<std::vector<Budget>> InMemoryBudgetStore::load_budgets() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Budget> budgets;
  budgets.reserve(budgets_.size());
  for (const auto& it : budgets_) {
    budgets.emplace_back(it.second);
  }
  return budgets;
}

absl::Status InMemoryBudgetStore::save_budget(const Budget& budget) {
  std::lock_guard<std::mutex> lock(mutex_);
  budgets_.insert_or_assign(budget.id, budget);
  return absl::OkStatus();
}

absl::Status InMemoryBudgetStore::append_cost_record(
    const CostRecord& record,
    const std::string& cost_type) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (max_cost_records_ == 0) {
    return absl::OkStatus();
  }
  while (cost_records_.size() >= max_cost_records_) {
    cost_records_.pop_front();
  }
  cost_records_.emplace_back(record, cost_type);
  return absl::OkStatus();
}

absl::Status InMemoryBudgetStore::upsert_daily_cost(const std::string& date,
                                                    const std::string& scope,
                                                    double delta) {
  std::lock_guard<std::mutex> lock(mutex_);
  daily_costs_[std::make_pair(date, scope)] += delta;
  return absl::OkStatus();
}

std::vector<std::pair<CostRecord, std::string>>
InMemoryBudgetStore::cost_records() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {cost_records_.begin(), cost_records_.end()};
}

double InMemoryBudgetStore::daily_cost(const std::string& date,
                                       const std::string& scope) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = daily_costs_.find(std::make_pair(date, scope));
  return it == daily_costs_.end() ? 0.0 : it->second;
}

absl::StatusOr<Feature> InMemoryConfigStore::get_feature(
    const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(id);
  if (it == index_.end()) {
    return not_found_error(absl::StrCat("feature not found: ", id));
  }
  return features_[it->second];
}

absl::StatusOr<std::vector<Feature>>
InMemoryConfigStore::get_features_by_category(const std::string& category) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Feature> features;
  for (const auto& feature : features_) {
    if (feature.category == category) {
      features.emplace_back(feature);
    }
  }
  return features;
}

void InMemoryConfigStore::put_feature(Feature feature) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = index_.find(feature.id);
  if (it != index_.end()) {
    features_[it->second] = std::move(feature);
    return;
  }
  index_[feature.id] = features_.size();
  features_.emplace_back(std::move(feature));
}

absl::Status InMemoryConfigStore::load_file(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return not_found_error(absl::StrCat("cannot open feature file: ", path));
  }

  nlohmann::json json;
  try {
    json = nlohmann::json::parse(file);
  } catch (const nlohmann::json::parse_error& e) {
    return invalid_argument_error(
        absl::StrCat("malformed feature file ", path, ": ", e.what()));
  }

  auto features = parse_features(json);
  if (!features.ok()) {
    return features.status();
  }
  for (auto& feature : *features) {
    LOG(INFO) << "Load feature " << feature.id << " with "
              << feature.providers.size() << " providers";
    put_feature(std::move(feature));
  }
  return absl::OkStatus();
}

size_t InMemoryConfigStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return features_.size();
}

}  // namespace ai_platform
