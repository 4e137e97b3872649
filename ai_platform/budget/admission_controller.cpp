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

#include "budget/admission_controller.h"

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include <algorithm>
#include <mutex>
#include <optional>
#include <utility>

#include "common/errors.h"
#include "common/utils.h"

namespace ai_platform {

namespace {

constexpr char kSelfHostedProvider[] = "self_hosted";
constexpr char kDefaultPeriod[] = "monthly";
constexpr double kCriticalPercentage = 90.0;

std::vector<AlertThreshold> default_alerts(const std::string& last_action) {
  return {{0.7, "notify", true}, {0.9, last_action, true}};
}

// Fills in the derived fields of a new budget and validates it.
absl::Status prepare_budget(Budget* budget, absl::Time now) {
  if (budget->type.empty()) {
    budget->type = kGlobalScope;
  }
  if (budget->type != kGlobalScope && budget->type != kServiceScope &&
      budget->type != kTenantScope) {
    return invalid_argument_error(
        absl::StrCat("unsupported budget type: ", budget->type));
  }
  if (budget->type != kGlobalScope && budget->target_id.empty()) {
    return invalid_argument_error("target_id is required");
  }
  if (budget->amount < 0) {
    return invalid_argument_error("amount must not be negative");
  }
  if (budget->id.empty()) {
    budget->id = budget_id_of(budget->type, budget->target_id);
  }
  if (budget->name.empty()) {
    budget->name = budget->id;
  }
  if (budget->period.empty()) {
    budget->period = kDefaultPeriod;
  }
  if (budget->alerts.empty()) {
    budget->alerts = default_alerts("switch_to_third_party");
  }
  if (budget->period_start == absl::UnixEpoch()) {
    budget->period_start = now;
  }
  budget->created_at = now;
  budget->updated_at = now;
  return absl::OkStatus();
}

}  // namespace

std::string budget_id_of(const std::string& type, const std::string& target) {
  if (type == kGlobalScope) {
    return kGlobalScope;
  }
  return absl::StrCat(type, ":", target);
}

std::string cost_type_of(const std::string& provider) {
  if (provider.empty() || provider == kSelfHostedProvider) {
    return kSelfHostedProvider;
  }
  return absl::StrCat("third_party_", provider);
}

BudgetInfo make_budget_info(const Budget& budget, double used) {
  BudgetInfo info;
  info.total = budget.amount;
  info.used = used;
  info.remaining = budget.amount - used;
  if (budget.amount > 0) {
    info.percentage = used / budget.amount * 100.0;
  } else {
    info.percentage = used > 0 ? 100.0 : 0.0;
  }
  return info;
}

AdmissionController::AdmissionController(const Options& options,
                                         std::shared_ptr<BudgetStore> store,
                                         std::shared_ptr<Clock> clock)
    : options_(options),
      store_(std::move(store)),
      clock_(std::move(clock)),
      alert_events_("budget-alerts", options.event_queue_capacity()),
      cost_sync_task_("budget-cost-sync",
                      absl::Seconds(options.cost_sync_interval_s()),
                      [this]() { sync_spending(); }),
      threadpool_(std::max(options.persistence_threads(), 1)) {}

AdmissionController::~AdmissionController() {
  stop();
  alert_events_.close_all();
}

void AdmissionController::start() { cost_sync_task_.start(); }

void AdmissionController::stop() { cost_sync_task_.stop(); }

absl::Status AdmissionController::load_budgets() {
  absl::StatusOr<std::vector<Budget>> budgets =
      store_ ? store_->load_budgets()
             : absl::StatusOr<std::vector<Budget>>(std::vector<Budget>());
  if (!budgets.ok()) {
    LOG(WARNING) << "Load budgets from store failed: " << budgets.status();
    if (options_.seed_default_budgets()) {
      seed_default_budgets();
    }
    return absl::OkStatus();
  }
  if (budgets->empty()) {
    if (options_.seed_default_budgets()) {
      seed_default_budgets();
    }
    return absl::OkStatus();
  }

  const absl::Time now = clock_->now();
  std::unique_lock<std::shared_mutex> lock(mutex_);
  for (auto& budget : *budgets) {
    Spending spending;
    spending.budget_id = budget.id;
    spending.period_start = now;
    spendings_.insert_or_assign(budget.id, std::move(spending));
    budgets_.insert_or_assign(budget.id, std::move(budget));
  }
  LOG(INFO) << "Load budgets from store: " << budgets_.size();
  return absl::OkStatus();
}

void AdmissionController::seed_default_budgets() {
  Budget global;
  global.name = "Global monthly budget";
  global.type = kGlobalScope;
  global.amount = 30000;
  global.period = "monthly";
  global.alerts = default_alerts("switch_to_third_party");

  Budget text_to_image;
  text_to_image.name = "Text to image daily budget";
  text_to_image.type = kServiceScope;
  text_to_image.target_id = "text_to_image";
  text_to_image.amount = 1000;
  text_to_image.period = "daily";
  text_to_image.alerts = default_alerts("block");

  const absl::Time now = clock_->now();
  std::vector<Budget> defaults = {std::move(global), std::move(text_to_image)};
  for (Budget& budget : defaults) {
    absl::Status status = prepare_budget(&budget, now);
    if (!status.ok()) {
      LOG(ERROR) << "Invalid default budget " << budget.id << ": " << status;
      continue;
    }
    {
      std::unique_lock<std::shared_mutex> lock(mutex_);
      if (!budgets_.emplace(budget.id, budget).second) {
        continue;
      }
      Spending spending;
      spending.budget_id = budget.id;
      spending.period_start = budget.period_start;
      spendings_.try_emplace(budget.id, std::move(spending));
    }
    if (store_) {
      status = store_->save_budget(budget);
      if (!status.ok()) {
        LOG(WARNING) << "Persist default budget " << budget.id
                     << " failed: " << status;
      }
    }
    LOG(INFO) << "Seed default budget " << budget.id << ", amount "
              << budget.amount << " per " << budget.period;
  }
}

absl::StatusOr<BudgetCheckResult> AdmissionController::check_budget(
    const std::string& feature,
    const std::string& tenant_id,
    double estimated_cost) {
  if (estimated_cost < 0) {
    return invalid_argument_error("estimated_cost must not be negative");
  }

  struct ScopeCheck {
    std::string budget_id;
    std::string reason;
    std::optional<BudgetInfo>* info;
  };

  BudgetCheckResult result;
  std::vector<ScopeCheck> scopes;
  scopes.push_back({kGlobalScope, "global budget exceeded",
                    &result.global_budget});
  scopes.push_back({budget_id_of(kServiceScope, feature),
                    absl::StrCat("service budget for ", feature, " exceeded"),
                    &result.service_budget});
  if (!tenant_id.empty()) {
    scopes.push_back(
        {budget_id_of(kTenantScope, tenant_id),
         absl::StrCat("tenant budget for ", tenant_id, " exceeded"),
         &result.tenant_budget});
  }

  const absl::Time now = clock_->now();
  std::vector<BudgetAlert> alerts;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<const Budget*> passed;
    for (auto& scope : scopes) {
      auto it = budgets_.find(scope.budget_id);
      if (it == budgets_.end()) {
        continue;
      }
      const double used = spent(scope.budget_id);
      if (used + estimated_cost > it->second.amount) {
        result.allowed = false;
        result.reason = std::move(scope.reason);
        LOG(WARNING) << "Reject request of " << feature << ": "
                     << result.reason << ", used " << used << " of "
                     << it->second.amount;
        return result;
      }
      *scope.info = make_budget_info(it->second, used);
      passed.emplace_back(&it->second);
    }

    size_t index = 0;
    for (auto& scope : scopes) {
      if (!scope.info->has_value()) {
        continue;
      }
      collect_alerts(*passed[index++], scope.info->value(), now, &alerts);
    }
  }

  for (const auto& alert : alerts) {
    LOG(WARNING) << "Budget " << alert.budget_id << " reaches "
                 << alert.percentage << "%, alert: " << alert.type;
    alert_events_.publish(alert);
  }
  return result;
}

absl::Status AdmissionController::record_cost(const CostRecord& record) {
  if (record.feature.empty()) {
    return invalid_argument_error("feature is required");
  }
  if (record.amount < 0) {
    return invalid_argument_error("amount must not be negative");
  }

  const absl::Time now = clock_->now();
  CostRecord stored = record;
  if (stored.id.empty()) {
    stored.id = absl::StrCat("cost-", utils::random_hex(16));
  }
  if (stored.timestamp == absl::UnixEpoch()) {
    stored.timestamp = now;
  }

  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const std::string& scope :
         {std::string(kGlobalScope),
          budget_id_of(kServiceScope, record.feature)}) {
      Spending& spending = spendings_[scope];
      if (spending.budget_id.empty()) {
        spending.budget_id = scope;
        spending.period_start = now;
      }
      spending.amount += record.amount;
      unsynced_[scope] += record.amount;
    }
  }

  VLOG(1) << "Record cost " << record.amount << " of " << record.feature
          << " on " << cost_type_of(record.provider);
  persist_cost_async(std::move(stored));
  return absl::OkStatus();
}

absl::StatusOr<Budget> AdmissionController::create_budget(Budget budget) {
  absl::Status status = prepare_budget(&budget, clock_->now());
  if (!status.ok()) {
    return status;
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (budgets_.find(budget.id) != budgets_.end()) {
    return invalid_argument_error(
        absl::StrCat("budget already exists: ", budget.id));
  }
  if (store_) {
    status = store_->save_budget(budget);
    if (!status.ok()) {
      LOG(ERROR) << "Persist budget " << budget.id << " failed: " << status;
      return status;
    }
  }

  Spending spending;
  spending.budget_id = budget.id;
  spending.period_start = budget.period_start;
  spendings_.try_emplace(budget.id, std::move(spending));
  budgets_.emplace(budget.id, budget);
  LOG(INFO) << "Create budget " << budget.id << ", amount " << budget.amount
            << " per " << budget.period;
  return budget;
}

absl::StatusOr<Budget> AdmissionController::update_budget(
    const std::string& budget_id,
    const Budget& budget) {
  if (budget.amount < 0) {
    return invalid_argument_error("amount must not be negative");
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  auto it = budgets_.find(budget_id);
  if (it == budgets_.end()) {
    return not_found_error(absl::StrCat("budget not found: ", budget_id));
  }

  Budget updated = it->second;
  if (!budget.name.empty()) {
    updated.name = budget.name;
  }
  updated.amount = budget.amount;
  if (!budget.period.empty()) {
    updated.period = budget.period;
  }
  if (!budget.alerts.empty()) {
    updated.alerts = budget.alerts;
  }
  updated.updated_at = clock_->now();

  if (store_) {
    absl::Status status = store_->save_budget(updated);
    if (!status.ok()) {
      LOG(ERROR) << "Persist budget " << budget_id << " failed: " << status;
      return status;
    }
  }
  it->second = updated;
  LOG(INFO) << "Update budget " << budget_id << ", amount " << updated.amount;
  return updated;
}

absl::StatusOr<Budget> AdmissionController::get_budget(
    const std::string& budget_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = budgets_.find(budget_id);
  if (it == budgets_.end()) {
    return not_found_error(absl::StrCat("budget not found: ", budget_id));
  }
  return it->second;
}

std::vector<Budget> AdmissionController::list_budgets(
    const BudgetFilter& filter) {
  std::vector<Budget> budgets;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto& it : budgets_) {
      const Budget& budget = it.second;
      if (!filter.type.empty() && budget.type != filter.type) {
        continue;
      }
      if (!filter.target_id.empty() && budget.target_id != filter.target_id) {
        continue;
      }
      budgets.emplace_back(budget);
    }
  }
  std::sort(budgets.begin(), budgets.end(),
            [](const Budget& a, const Budget& b) { return a.id < b.id; });
  return budgets;
}

absl::StatusOr<Spending> AdmissionController::get_spending(
    const std::string& budget_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = spendings_.find(budget_id);
  if (it == spendings_.end()) {
    return not_found_error(absl::StrCat("spending not found: ", budget_id));
  }
  return it->second;
}

std::shared_ptr<BoundedQueue<BudgetAlert>> AdmissionController::watch_alerts() {
  return alert_events_.subscribe();
}

size_t AdmissionController::sync_spending() {
  std::unordered_map<std::string, double> deltas;
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    deltas.swap(unsynced_);
  }
  if (deltas.empty() || !store_) {
    return 0;
  }

  const std::string date = utils::format_date(clock_->now());
  size_t flushed = 0;
  std::unordered_map<std::string, double> failed;
  for (const auto& it : deltas) {
    if (it.second == 0) {
      continue;
    }
    absl::Status status = store_->upsert_daily_cost(date, it.first, it.second);
    if (!status.ok()) {
      LOG(ERROR) << "Sync spending of " << it.first << " on " << date
                 << " failed: " << status;
      failed.emplace(it.first, it.second);
      continue;
    }
    ++flushed;
  }

  if (!failed.empty()) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (const auto& it : failed) {
      unsynced_[it.first] += it.second;
    }
  }
  VLOG(1) << "Sync spending of " << flushed << " scopes, " << failed.size()
          << " failed";
  return flushed;
}

double AdmissionController::spent(const std::string& budget_id) const {
  auto it = spendings_.find(budget_id);
  return it == spendings_.end() ? 0.0 : it->second.amount;
}

void AdmissionController::collect_alerts(
    const Budget& budget,
    const BudgetInfo& info,
    absl::Time now,
    std::vector<BudgetAlert>* alerts) const {
  for (const auto& threshold : budget.alerts) {
    if (!threshold.enabled || info.percentage < threshold.at * 100.0) {
      continue;
    }
    BudgetAlert alert;
    alert.budget_id = budget.id;
    alert.budget_name = budget.name;
    alert.type =
        info.percentage >= kCriticalPercentage ? "critical" : "warning";
    alert.used_amount = info.used;
    alert.total_amount = info.total;
    alert.percentage = info.percentage;
    alert.timestamp = now;
    alerts->emplace_back(std::move(alert));
  }
}

void AdmissionController::persist_cost_async(CostRecord record) {
  if (!store_) {
    return;
  }
  threadpool_.schedule([store = store_, record = std::move(record)]() {
    absl::Status status =
        store->append_cost_record(record, cost_type_of(record.provider));
    if (!status.ok()) {
      LOG(ERROR) << "Persist cost record " << record.id
                 << " failed: " << status;
    }
  });
}

}  // namespace ai_platform
