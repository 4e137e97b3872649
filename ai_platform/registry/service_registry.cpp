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

#include "registry/service_registry.h"

#include <absl/strings/str_cat.h>
#include <glog/logging.h>

#include <algorithm>
#include <mutex>
#include <utility>

#include "common/errors.h"
#include "common/utils.h"

namespace ai_platform {

namespace {

constexpr char kInitialConfigVersion[] = "v1";

const char* heartbeat_status(HealthState state) {
  switch (state) {
    case HealthState::DEGRADED:
      return "degraded";
    case HealthState::DRAINING:
      return "draining";
    default:
      return "healthy";
  }
}

bool is_live(HealthState state) {
  return state != HealthState::DRAINING && state != HealthState::TERMINATED;
}

}  // namespace

ServiceRegistry::ServiceRegistry(const Options& options,
                                 std::shared_ptr<ServiceStore> store,
                                 std::shared_ptr<Clock> clock)
    : options_(options),
      store_(std::move(store)),
      clock_(std::move(clock)),
      heartbeat_events_("heartbeat-events", options.event_queue_capacity()),
      health_check_task_("registry-health-check",
                         absl::Seconds(options.health_check_interval_s()),
                         [this]() { check_heartbeat_timeout(); }),
      threadpool_(std::max(options.persistence_threads(), 1)) {}

ServiceRegistry::~ServiceRegistry() {
  stop();
  heartbeat_events_.close_all();
}

void ServiceRegistry::start() { health_check_task_.start(); }

void ServiceRegistry::stop() { health_check_task_.stop(); }

absl::Status ServiceRegistry::load_from_store() {
  if (!store_) {
    return absl::OkStatus();
  }
  auto services = store_->load_services();
  if (!services.ok()) {
    LOG(ERROR) << "Load services from store failed: " << services.status();
    return services.status();
  }

  std::unique_lock<std::shared_mutex> lock(inst_mutex_);
  size_t loaded = 0;
  for (auto& service : *services) {
    if (service.state == HealthState::TERMINATED) {
      continue;
    }
    if (instances_.find(service.id) == instances_.end()) {
      index_instance(service);
    }
    instances_.insert_or_assign(service.id, std::move(service));
    ++loaded;
  }
  LOG(INFO) << "Load service instances from store: " << loaded;
  return absl::OkStatus();
}

absl::StatusOr<RegisterResponse> ServiceRegistry::register_service(
    const RegisterRequest& request) {
  if (request.service_type.empty()) {
    return invalid_argument_error("service_type is required");
  }
  if (request.hostname.empty() && request.ip_address.empty()) {
    return invalid_argument_error("hostname or ip_address is required");
  }
  if (request.port <= 0 || request.port > 65535) {
    return invalid_argument_error(
        absl::StrCat("invalid port: ", request.port));
  }

  const std::string service_id = utils::make_service_id(
      request.service_type, request.hostname, request.ip_address, request.port);
  const absl::Time now = clock_->now();
  auto generated = utils::generate_token();
  if (!generated.ok()) {
    LOG(ERROR) << "Fail to generate token for " << service_id << ": "
               << generated.status();
    return generated.status();
  }
  std::string token = std::move(generated).value();

  ServiceInstance snapshot;
  bool reregistered = false;
  {
    std::unique_lock<std::shared_mutex> lock(inst_mutex_);
    auto it = instances_.find(service_id);
    if (it != instances_.end()) {
      reregistered = true;
    } else {
      ServiceInstance instance;
      instance.id = service_id;
      instance.service_type = request.service_type;
      instance.started_at = now;
      instance.registered_at = now;
      it = instances_.emplace(service_id, std::move(instance)).first;
      index_instance(it->second);
    }

    ServiceInstance& instance = it->second;
    instance.version = request.version;
    instance.hostname = request.hostname;
    instance.ip_address = request.ip_address;
    instance.port = request.port;
    instance.capabilities = request.capabilities;
    instance.resources = request.resources;
    instance.performance = request.performance;
    instance.state = HealthState::HEALTHY;
    instance.last_heartbeat = now;
    instance.heartbeat_missed = 0;
    instance.token = token;
    instance.updated_at = now;
    snapshot = instance;
  }

  if (reregistered) {
    LOG(INFO) << "Re-register service instance " << service_id << " at "
              << snapshot.endpoint();
  } else {
    LOG(INFO) << "Register a new service instance " << service_id
              << ", type: " << request.service_type
              << ", endpoint: " << snapshot.endpoint();
  }
  persist_async(std::move(snapshot));

  RegisterResponse response;
  response.service_id = service_id;
  response.heartbeat_interval_seconds = options_.heartbeat_interval_s();
  response.config_version = kInitialConfigVersion;
  response.token = std::move(token);
  return response;
}

absl::StatusOr<HeartbeatResponse> ServiceRegistry::heartbeat(
    const HeartbeatRequest& request) {
  const absl::Time now = clock_->now();

  HeartbeatResponse response;
  ServiceInstance snapshot;
  {
    std::unique_lock<std::shared_mutex> lock(inst_mutex_);
    auto it = instances_.find(request.service_id);
    if (it == instances_.end() ||
        it->second.state == HealthState::TERMINATED) {
      return not_found_error(
          absl::StrCat("service not found: ", request.service_id));
    }
    ServiceInstance& instance = it->second;
    if (request.token.empty() || request.token != instance.token) {
      LOG(WARNING) << "Reject heartbeat with invalid token from "
                   << request.service_id;
      return unauthorized_error("invalid token");
    }

    const HealthState previous = instance.state;
    instance.last_heartbeat = now;
    instance.heartbeat_missed = 0;
    instance.metrics = request.metrics;
    instance.updated_at = now;
    instance.state = health_after_heartbeat(instance, request.metrics);
    if (instance.state != previous) {
      LOG(INFO) << "Service instance " << instance.id << " turns "
                << health_state_name(instance.state) << " from "
                << health_state_name(previous);
    }

    auto pending = pending_configs_.find(instance.id);
    if (pending != pending_configs_.end() && !pending->second.empty()) {
      response.config_update = std::move(pending->second.front());
      pending->second.pop_front();
      --pending_config_count_;
      if (pending->second.empty()) {
        pending_configs_.erase(pending);
      }
    }

    response.status = heartbeat_status(instance.state);
    response.drain_requested = instance.state == HealthState::DRAINING;
    snapshot = instance;
  }

  VLOG(1) << "Heartbeat from " << snapshot.id
          << ", load: " << snapshot.metrics.current_load
          << ", queue: " << snapshot.metrics.queue_size;

  HeartbeatEvent event;
  event.service_id = snapshot.id;
  event.service_type = snapshot.service_type;
  event.state = snapshot.state;
  event.metrics = snapshot.metrics;
  event.timestamp = now;
  heartbeat_events_.publish(event);

  persist_async(std::move(snapshot));
  return response;
}

absl::StatusOr<ShutdownResponse> ServiceRegistry::shutdown(
    const ShutdownRequest& request) {
  ServiceInstance snapshot;
  {
    std::unique_lock<std::shared_mutex> lock(inst_mutex_);
    auto it = instances_.find(request.service_id);
    if (it == instances_.end() ||
        it->second.state == HealthState::TERMINATED) {
      return not_found_error(
          absl::StrCat("service not found: ", request.service_id));
    }
    it->second.state = HealthState::DRAINING;
    it->second.updated_at = clock_->now();
    snapshot = it->second;
  }

  LOG(INFO) << "Service instance " << request.service_id
            << " is draining, reason: " << request.reason;
  persist_async(std::move(snapshot));

  ShutdownResponse response;
  response.grace_period_seconds = options_.shutdown_grace_period_s();
  response.message = "service marked as draining";
  return response;
}

absl::Status ServiceRegistry::mark_terminated(const std::string& service_id) {
  ServiceInstance snapshot;
  {
    std::unique_lock<std::shared_mutex> lock(inst_mutex_);
    auto it = instances_.find(service_id);
    if (it == instances_.end()) {
      return not_found_error(absl::StrCat("service not found: ", service_id));
    }
    if (it->second.state != HealthState::DRAINING) {
      return invalid_argument_error(
          absl::StrCat("service ", service_id, " is ",
                       health_state_name(it->second.state),
                       ", only draining services can terminate"));
    }
    it->second.state = HealthState::TERMINATED;
    it->second.updated_at = clock_->now();
    snapshot = it->second;

    unindex_instance(it->second);
    auto pending = pending_configs_.find(service_id);
    if (pending != pending_configs_.end()) {
      pending_config_count_ -= pending->second.size();
      pending_configs_.erase(pending);
    }
    instances_.erase(it);
  }

  {
    std::unique_lock<std::shared_mutex> lock(channel_mutex_);
    cached_channels_.erase(service_id);
  }

  LOG(INFO) << "Service instance " << service_id << " terminated";
  persist_async(std::move(snapshot));
  return absl::OkStatus();
}

std::shared_ptr<brpc::Channel> ServiceRegistry::get_channel(
    const std::string& service_id) {
  {
    std::shared_lock<std::shared_mutex> lock(channel_mutex_);
    auto iter = cached_channels_.find(service_id);
    if (iter != cached_channels_.end()) {
      return iter->second;
    }
  }

  std::string endpoint;
  {
    std::shared_lock<std::shared_mutex> lock(inst_mutex_);
    auto it = instances_.find(service_id);
    if (it == instances_.end()) {
      return nullptr;
    }
    endpoint = it->second.endpoint();
  }

  std::unique_lock<std::shared_mutex> lock(channel_mutex_);
  auto iter = cached_channels_.find(service_id);
  if (iter != cached_channels_.end()) {
    return iter->second;
  }
  auto channel = create_channel(endpoint);
  if (channel != nullptr) {
    cached_channels_[service_id] = channel;
  }
  return channel;
}

std::shared_ptr<brpc::Channel> ServiceRegistry::create_channel(
    const std::string& endpoint) {
  auto channel = std::make_shared<brpc::Channel>();
  brpc::ChannelOptions options;
  options.protocol = "http";
  options.timeout_ms = options_.provider_timeout_ms();
  options.max_retry = 0;
  if (channel->Init(endpoint.c_str(), "", &options) != 0) {
    LOG(ERROR) << "Fail to initialize channel for " << endpoint;
    return nullptr;
  }
  return channel;
}

absl::StatusOr<ServiceInstance> ServiceRegistry::get_service(
    const std::string& service_id) {
  std::shared_lock<std::shared_mutex> lock(inst_mutex_);
  auto it = instances_.find(service_id);
  if (it == instances_.end()) {
    return not_found_error(absl::StrCat("service not found: ", service_id));
  }
  return it->second;
}

ServiceList ServiceRegistry::list_services(const ServiceFilter& filter) {
  ServiceList list;
  {
    std::shared_lock<std::shared_mutex> lock(inst_mutex_);
    for (const auto& it : instances_) {
      const ServiceInstance& instance = it.second;
      if (!filter.service_type.empty() &&
          instance.service_type != filter.service_type) {
        continue;
      }
      if (filter.state.has_value() && instance.state != *filter.state) {
        continue;
      }
      list.services.emplace_back(instance);
    }
  }

  std::sort(list.services.begin(),
            list.services.end(),
            [](const ServiceInstance& a, const ServiceInstance& b) {
              return a.id < b.id;
            });
  for (const auto& instance : list.services) {
    switch (instance.state) {
      case HealthState::HEALTHY:
        ++list.healthy_count;
        break;
      case HealthState::DEGRADED:
        ++list.degraded_count;
        break;
      case HealthState::UNHEALTHY:
        ++list.unhealthy_count;
        break;
      default:
        break;
    }
  }
  list.total_count = static_cast<int32_t>(list.services.size());
  return list;
}

std::vector<ServiceInstance> ServiceRegistry::get_healthy_services(
    const std::string& service_type) {
  std::vector<ServiceInstance> services;
  std::shared_lock<std::shared_mutex> lock(inst_mutex_);
  auto ids = type_index_.find(service_type);
  if (ids == type_index_.end()) {
    return services;
  }
  for (const auto& id : ids->second) {
    auto it = instances_.find(id);
    if (it != instances_.end() && it->second.state == HealthState::HEALTHY) {
      services.emplace_back(it->second);
    }
  }
  return services;
}

std::vector<ServiceInstance> ServiceRegistry::get_services_by_type(
    const std::string& service_type) {
  std::vector<ServiceInstance> services;
  std::shared_lock<std::shared_mutex> lock(inst_mutex_);
  auto ids = type_index_.find(service_type);
  if (ids == type_index_.end()) {
    return services;
  }
  for (const auto& id : ids->second) {
    auto it = instances_.find(id);
    if (it == instances_.end()) {
      continue;
    }
    if (it->second.state == HealthState::HEALTHY ||
        it->second.state == HealthState::DEGRADED) {
      services.emplace_back(it->second);
    }
  }
  return services;
}

absl::Status ServiceRegistry::update_config(const std::string& service_id,
                                            const nlohmann::json& config) {
  std::unique_lock<std::shared_mutex> lock(inst_mutex_);
  if (instances_.find(service_id) == instances_.end()) {
    return not_found_error(absl::StrCat("service not found: ", service_id));
  }
  if (pending_config_count_ >=
      static_cast<size_t>(options_.max_pending_config_updates())) {
    LOG(WARNING) << "Config update queue is full, drop update for "
                 << service_id;
    return unavailable_error("config update queue is full");
  }

  ConfigUpdate update;
  update.version = absl::StrCat(absl::ToUnixSeconds(clock_->now()));
  update.config = config;
  pending_configs_[service_id].emplace_back(std::move(update));
  ++pending_config_count_;
  LOG(INFO) << "Queue config update for " << service_id;
  return absl::OkStatus();
}

std::shared_ptr<BoundedQueue<HeartbeatEvent>>
ServiceRegistry::watch_heartbeats() {
  return heartbeat_events_.subscribe();
}

size_t ServiceRegistry::check_heartbeat_timeout() {
  const absl::Time now = clock_->now();
  const absl::Duration timeout = absl::Seconds(options_.heartbeat_timeout_s());

  std::vector<ServiceInstance> turned_unhealthy;
  {
    std::unique_lock<std::shared_mutex> lock(inst_mutex_);
    for (auto& it : instances_) {
      ServiceInstance& instance = it.second;
      if (!is_live(instance.state)) {
        continue;
      }
      if (now - instance.last_heartbeat <= timeout) {
        continue;
      }
      ++instance.heartbeat_missed;
      if (instance.heartbeat_missed >= options_.max_missed_heartbeats() &&
          instance.state != HealthState::UNHEALTHY) {
        instance.state = HealthState::UNHEALTHY;
        instance.updated_at = now;
        turned_unhealthy.emplace_back(instance);
      }
    }
  }

  for (auto& instance : turned_unhealthy) {
    LOG(WARNING) << "Service instance " << instance.id
                 << " marked unhealthy, missed heartbeats: "
                 << instance.heartbeat_missed;
    persist_async(std::move(instance));
  }
  return turned_unhealthy.size();
}

void ServiceRegistry::persist_async(ServiceInstance snapshot) {
  if (!store_) {
    return;
  }
  threadpool_.schedule([store = store_, snapshot = std::move(snapshot)]() {
    absl::Status status = store->upsert_service(snapshot);
    if (!status.ok()) {
      LOG(ERROR) << "Persist service instance " << snapshot.id
                 << " failed: " << status;
    }
  });
}

HealthState ServiceRegistry::health_after_heartbeat(
    const ServiceInstance& instance,
    const InstanceMetrics& metrics) const {
  if (instance.state == HealthState::DRAINING) {
    return HealthState::DRAINING;
  }
  if (metrics.processed_count > 0) {
    const double error_rate = static_cast<double>(metrics.error_count) /
                              static_cast<double>(metrics.processed_count);
    if (error_rate > options_.degraded_error_rate()) {
      return HealthState::DEGRADED;
    }
  }
  return HealthState::HEALTHY;
}

void ServiceRegistry::index_instance(const ServiceInstance& instance) {
  auto& ids = type_index_[instance.service_type];
  if (std::find(ids.begin(), ids.end(), instance.id) == ids.end()) {
    ids.emplace_back(instance.id);
  }
}

void ServiceRegistry::unindex_instance(const ServiceInstance& instance) {
  auto it = type_index_.find(instance.service_type);
  if (it == type_index_.end()) {
    return;
  }
  auto& ids = it->second;
  ids.erase(std::remove(ids.begin(), ids.end(), instance.id), ids.end());
  if (ids.empty()) {
    type_index_.erase(it);
  }
}

}  // namespace ai_platform
