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

#include "scaler/auto_scaler.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <glog/logging.h>

#include <algorithm>
#include <mutex>
#include <utility>

#include "common/errors.h"

namespace ai_platform {

namespace {

ScaleConfig make_scale_config(const std::string& feature_id,
                              int32_t max_instances,
                              int64_t target_queue_size,
                              int64_t idle_timeout_s,
                              const std::string& name_space) {
  ScaleConfig config;
  config.feature_id = feature_id;
  config.min_instances = 0;
  config.max_instances = max_instances;
  config.target_cpu = 70.0;
  config.target_queue_size = target_queue_size;
  config.idle_timeout_s = idle_timeout_s;
  config.scale_up_cooldown_s = 60;
  config.scale_down_cooldown_s = 300;
  config.deployment_name = absl::StrCat(feature_id, "-inference");
  config.name_space = name_space;
  return config;
}

absl::Status no_scale_config(const std::string& feature_id) {
  return not_found_error(
      absl::StrCat("no scale config for feature: ", feature_id));
}

}  // namespace

const char* scale_action_name(ScaleAction action) {
  switch (action) {
    case ScaleAction::SCALE_UP:
      return "scale_up";
    case ScaleAction::SCALE_DOWN:
      return "scale_down";
    case ScaleAction::SCALE_TO_ZERO:
      return "scale_to_zero";
    default:
      return "none";
  }
}

std::vector<ScaleConfig> default_scale_configs(const std::string& name_space) {
  return {
      make_scale_config("text_to_image", 5, 50, 900, name_space),
      make_scale_config("image_editing", 3, 30, 600, name_space),
      make_scale_config("image_stylization", 2, 20, 600, name_space),
  };
}

AutoScaler::AutoScaler(const Options& options,
                       std::shared_ptr<ServiceRegistry> registry,
                       std::shared_ptr<ClusterClient> cluster,
                       std::shared_ptr<Clock> clock)
    : options_(options),
      registry_(std::move(registry)),
      cluster_(std::move(cluster)),
      clock_(std::move(clock)),
      scale_events_("scale-events", options.event_queue_capacity()),
      scale_task_("scale-loop",
                  absl::Seconds(options.scale_check_interval_s()),
                  [this]() { run_scale_round(); }) {
  for (auto& config : default_scale_configs(options_.default_namespace())) {
    configs_.emplace(config.feature_id, std::move(config));
  }
}

AutoScaler::~AutoScaler() {
  stop();
  scale_events_.close_all();
}

void AutoScaler::start() { scale_task_.start(); }

void AutoScaler::stop() { scale_task_.stop(); }

absl::StatusOr<ScaleDecision> AutoScaler::check_scale(
    const std::string& feature_id) {
  ScaleConfig config;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = configs_.find(feature_id);
    if (it == configs_.end()) {
      return no_scale_config(feature_id);
    }
    config = it->second;
  }

  auto current = cluster_->get_replicas(config.deployment_name,
                                        config.name_space);
  if (!current.ok()) {
    return current.status();
  }
  const absl::Time now = clock_->now();
  const ScaleMetrics metrics =
      observe(feature_id, registry_->get_services_by_type(feature_id), now);

  ScaleDecision decision;
  decision.feature_id = feature_id;
  decision.current_replicas = *current;
  decision.target_replicas = *current;
  decision.metrics = metrics;

  if (should_scale_up(config, metrics, *current)) {
    if (now - config.last_scale_up <
        absl::Seconds(config.scale_up_cooldown_s)) {
      decision.reason = "scale up cooldown";
      return decision;
    }
    decision.action = ScaleAction::SCALE_UP;
    decision.target_replicas = std::min(*current + 1, config.max_instances);
    decision.reason =
        absl::StrFormat("cpu usage: %.2f%%, queue: %d, rps: %.2f",
                        metrics.cpu_usage, metrics.queue_size,
                        metrics.requests_per_sec);
  } else if (should_scale_down(config, metrics, *current)) {
    if (now - config.last_scale_down <
        absl::Seconds(config.scale_down_cooldown_s)) {
      decision.reason = "scale down cooldown";
      return decision;
    }
    const int32_t target = std::max(*current - 1, config.min_instances);
    if (target == 0) {
      if (metrics.idle_time_s < config.idle_timeout_s) {
        decision.reason = absl::StrCat("idle for ", metrics.idle_time_s,
                                       "s, waiting for idle timeout");
        return decision;
      }
      decision.action = ScaleAction::SCALE_TO_ZERO;
      decision.target_replicas = 0;
      decision.reason = "idle timeout, scale to zero";
    } else {
      decision.action = ScaleAction::SCALE_DOWN;
      decision.target_replicas = target;
      decision.reason = absl::StrFormat("low utilization: cpu=%.2f%%, idle=%ds",
                                        metrics.cpu_usage,
                                        metrics.idle_time_s);
    }
  } else {
    decision.reason = "no scale needed";
    return decision;
  }

  absl::Status status = apply(config, decision.action, *current,
                              decision.target_replicas, decision.reason);
  if (!status.ok()) {
    return status;
  }
  return decision;
}

size_t AutoScaler::run_scale_round() {
  size_t actions = 0;
  for (const auto& feature_id : features()) {
    auto decision = check_scale(feature_id);
    if (!decision.ok()) {
      LOG(WARNING) << "Check scale failed for " << feature_id << ": "
                   << decision.status();
      continue;
    }
    if (decision->action != ScaleAction::NONE) {
      ++actions;
      continue;
    }
    VLOG(1) << "No scale action for " << feature_id << ": "
            << decision->reason;
  }
  return actions;
}

absl::Status AutoScaler::update_scale_config(ScaleConfig config) {
  if (config.feature_id.empty()) {
    return invalid_argument_error("feature_id is required");
  }
  if (config.min_instances < 0 || config.max_instances < config.min_instances) {
    return invalid_argument_error(
        absl::StrCat("invalid instance bounds: [", config.min_instances, ", ",
                     config.max_instances, "]"));
  }
  if (config.deployment_name.empty()) {
    config.deployment_name = absl::StrCat(config.feature_id, "-inference");
  }
  if (config.name_space.empty()) {
    config.name_space = options_.default_namespace();
  }

  LOG(INFO) << "Update scale config of " << config.feature_id << ": ["
            << config.min_instances << ", " << config.max_instances
            << "], deployment " << config.name_space << "/"
            << config.deployment_name;
  std::unique_lock<std::shared_mutex> lock(mutex_);
  configs_.insert_or_assign(config.feature_id, std::move(config));
  return absl::OkStatus();
}

absl::StatusOr<ScaleConfig> AutoScaler::get_scale_config(
    const std::string& feature_id) {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  auto it = configs_.find(feature_id);
  if (it == configs_.end()) {
    return no_scale_config(feature_id);
  }
  return it->second;
}

std::vector<std::string> AutoScaler::features() {
  std::vector<std::string> ids;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    ids.reserve(configs_.size());
    for (const auto& it : configs_) {
      ids.emplace_back(it.first);
    }
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

absl::Status AutoScaler::scale_up(const std::string& feature_id,
                                  int32_t count) {
  if (count <= 0) {
    return invalid_argument_error("count must be positive");
  }
  auto config = get_scale_config(feature_id);
  if (!config.ok()) {
    return config.status();
  }
  auto current = cluster_->get_replicas(config->deployment_name,
                                        config->name_space);
  if (!current.ok()) {
    return current.status();
  }
  const int32_t target = std::min(*current + count, config->max_instances);
  if (target <= *current) {
    return absl::OkStatus();
  }
  return apply(*config, ScaleAction::SCALE_UP, *current, target,
               absl::StrCat("manual scale up by ", count));
}

absl::Status AutoScaler::scale_to_zero(const std::string& feature_id) {
  auto config = get_scale_config(feature_id);
  if (!config.ok()) {
    return config.status();
  }
  auto current = cluster_->get_replicas(config->deployment_name,
                                        config->name_space);
  if (!current.ok()) {
    return current.status();
  }
  return apply(*config, ScaleAction::SCALE_TO_ZERO, *current, 0,
               "manual scale to zero");
}

std::shared_ptr<BoundedQueue<ScaleEvent>> AutoScaler::watch_scale_events() {
  return scale_events_.subscribe();
}

ScaleMetrics AutoScaler::observe(const std::string& feature_id,
                                 const std::vector<ServiceInstance>& services,
                                 absl::Time now) {
  ScaleMetrics metrics;
  int64_t processed = 0;
  bool busy = false;
  if (!services.empty()) {
    for (const auto& service : services) {
      metrics.cpu_usage += service.metrics.cpu_utilization;
      metrics.gpu_usage += service.metrics.gpu_utilization;
      metrics.memory_usage += service.metrics.memory_usage;
      metrics.queue_size += service.metrics.queue_size;
      processed += service.metrics.processed_count;
      busy = busy || service.metrics.current_load > 0;
    }
    const double count = static_cast<double>(services.size());
    metrics.cpu_usage /= count;
    metrics.gpu_usage /= count;
    metrics.memory_usage /= count;
  }
  busy = busy || metrics.queue_size > 0;

  std::unique_lock<std::shared_mutex> lock(mutex_);
  Activity& activity = activities_[feature_id];
  if (!activity.observed) {
    activity.observed = true;
    activity.last_active = now;
  } else {
    const int64_t delta = processed - activity.last_processed;
    const double elapsed = absl::ToDoubleSeconds(now - activity.last_sample);
    if (delta > 0) {
      busy = true;
      if (elapsed > 0) {
        metrics.requests_per_sec = static_cast<double>(delta) / elapsed;
      }
    }
  }
  if (busy) {
    activity.last_active = now;
  }
  activity.last_sample = now;
  activity.last_processed = processed;
  metrics.idle_time_s = absl::ToInt64Seconds(now - activity.last_active);
  return metrics;
}

bool AutoScaler::should_scale_up(const ScaleConfig& config,
                                 const ScaleMetrics& metrics,
                                 int32_t current) const {
  if (current >= config.max_instances) {
    return false;
  }
  return metrics.cpu_usage > config.target_cpu ||
         metrics.queue_size > config.target_queue_size ||
         metrics.requests_per_sec > options_.scale_up_rps_ceiling();
}

bool AutoScaler::should_scale_down(const ScaleConfig& config,
                                   const ScaleMetrics& metrics,
                                   int32_t current) const {
  if (current <= config.min_instances) {
    return false;
  }
  if (metrics.idle_time_s >= config.idle_timeout_s) {
    return true;
  }
  return metrics.cpu_usage < config.target_cpu / 2 && metrics.queue_size == 0;
}

absl::Status AutoScaler::apply(const ScaleConfig& config,
                               ScaleAction action,
                               int32_t current,
                               int32_t target,
                               const std::string& reason) {
  absl::Status status =
      cluster_->set_replicas(config.deployment_name, config.name_space, target);
  if (!status.ok()) {
    LOG(ERROR) << "Scale " << config.feature_id << " from " << current
               << " to " << target << " failed: " << status;
    return status;
  }

  const absl::Time now = clock_->now();
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = configs_.find(config.feature_id);
    if (it != configs_.end()) {
      if (action == ScaleAction::SCALE_UP) {
        it->second.last_scale_up = now;
      } else {
        it->second.last_scale_down = now;
      }
    }
  }

  LOG(INFO) << "Scale " << config.feature_id << " ("
            << scale_action_name(action) << ") from " << current << " to "
            << target << ", reason: " << reason;
  ScaleEvent event;
  event.feature_id = config.feature_id;
  event.action = action;
  event.current = current;
  event.target = target;
  event.reason = reason;
  event.timestamp = now;
  scale_events_.publish(event);
  return absl::OkStatus();
}

}  // namespace ai_platform
