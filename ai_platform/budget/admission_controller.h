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

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "budget/budget_types.h"
#include "common/clock.h"
#include "common/event_queue.h"
#include "common/macros.h"
#include "common/options.h"
#include "common/periodic_task.h"
#include "common/threadpool.h"
#include "storage/storage.h"

namespace ai_platform {

// Pre-dispatch spend check and running spend accounting.
//
// Scopes are checked global -> service:<feature> -> tenant:<tenant>. Spend is
// only ever added by record_cost(), which touches the global and service
// scopes. A periodic task flushes the spend accumulated since the last flush
// into the daily statistics of the store.
class AdmissionController final {
 public:
  AdmissionController(const Options& options,
                      std::shared_ptr<BudgetStore> store,
                      std::shared_ptr<Clock> clock = Clock::real());

  ~AdmissionController();

  // Loads persisted budgets. Seeds the default budgets when the store has
  // none or fails, unless seeding is disabled.
  absl::Status load_budgets();

  void start();
  void stop();

  // allowed == false with a scope specific reason on the first exceeded
  // scope. A rejected check has no side effects.
  absl::StatusOr<BudgetCheckResult> check_budget(const std::string& feature,
                                                 const std::string& tenant_id,
                                                 double estimated_cost);

  absl::Status record_cost(const CostRecord& record);

  // Derives the id from type and target when empty. Thresholds default to
  // 70% notify and 90% switch_to_third_party.
  absl::StatusOr<Budget> create_budget(Budget budget);

  // Replaces name, amount, period and alerts of an existing budget.
  absl::StatusOr<Budget> update_budget(const std::string& budget_id,
                                       const Budget& budget);

  absl::StatusOr<Budget> get_budget(const std::string& budget_id);

  std::vector<Budget> list_budgets(const BudgetFilter& filter);

  absl::StatusOr<Spending> get_spending(const std::string& budget_id);

  std::shared_ptr<BoundedQueue<BudgetAlert>> watch_alerts();

  // Flushes per scope spend deltas into the daily statistics. A failed upsert
  // keeps its delta for the next round. Returns the number of scopes flushed.
  size_t sync_spending();

 private:
  DISALLOW_COPY_AND_ASSIGN(AdmissionController);

  void seed_default_budgets();

  // Requires mutex_ held.
  double spent(const std::string& budget_id) const;

  void collect_alerts(const Budget& budget,
                      const BudgetInfo& info,
                      absl::Time now,
                      std::vector<BudgetAlert>* alerts) const;

  void persist_cost_async(CostRecord record);

 private:
  Options options_;

  std::shared_ptr<BudgetStore> store_;
  std::shared_ptr<Clock> clock_;

  std::shared_mutex mutex_;
  std::unordered_map<std::string, Budget> budgets_;
  std::unordered_map<std::string, Spending> spendings_;
  // scope -> spend not yet flushed to the daily statistics
  std::unordered_map<std::string, double> unsynced_;

  EventBroadcaster<BudgetAlert> alert_events_;

  PeriodicTask cost_sync_task_;

  ThreadPool threadpool_;
};

// "global", or "<type>:<target>".
std::string budget_id_of(const std::string& type, const std::string& target);

BudgetInfo make_budget_info(const Budget& budget, double used);

// "self_hosted" or "third_party_<provider>".
std::string cost_type_of(const std::string& provider);

}  // namespace ai_platform
