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

#include <brpc/server.h>
#include <gflags/gflags.h>
#include <glog/logging.h>

#include <memory>

#include "budget/admission_controller.h"
#include "common/global_gflags.h"
#include "common/options.h"
#include "gateway/inference_gateway.h"
#include "gateway/inference_http_service.h"
#include "provider/key_manager.h"
#include "provider/provider_factory.h"
#include "ratelimit/rate_limiter.h"
#include "registry/registry_rpc_service.h"
#include "registry/service_registry.h"
#include "router/routing_engine.h"
#include "scaler/auto_scaler.h"
#include "scaler/cluster_client.h"
#include "storage/memory_storage.h"

using namespace ai_platform;

int main(int argc, char* argv[]) {
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  const Options options = Options::from_flags();
  LOG(INFO) << "Start control plane with " << options.to_string();

  // Process local stores until a database collaborator is wired in. Cost
  // records are bounded; daily statistics carry the totals.
  auto service_store = std::make_shared<InMemoryServiceStore>();
  auto budget_store = std::make_shared<InMemoryBudgetStore>();
  auto config_store = std::make_shared<InMemoryConfigStore>();
  if (!FLAGS_feature_config_file.empty()) {
    absl::Status status = config_store->load_file(FLAGS_feature_config_file);
    if (!status.ok()) {
      LOG(ERROR) << "Load feature config " << FLAGS_feature_config_file
                 << " failed: " << status;
      return -1;
    }
  }

  auto registry = std::make_shared<ServiceRegistry>(options, service_store);
  absl::Status status = registry->load_from_store();
  if (!status.ok()) {
    LOG(WARNING) << "Start with an empty registry: " << status;
  }

  auto admission = std::make_shared<AdmissionController>(options, budget_store);
  status = admission->load_budgets();
  if (!status.ok()) {
    LOG(ERROR) << "Load budgets failed: " << status;
    return -1;
  }

  auto cluster = std::make_shared<InMemoryClusterClient>();
  const auto scale_configs = default_scale_configs(options.default_namespace());
  for (const auto& config : scale_configs) {
    cluster->add_deployment(
        config.deployment_name, config.name_space, config.min_instances);
  }
  auto scaler = std::make_shared<AutoScaler>(options, registry, cluster);

  auto router = std::make_shared<RoutingEngine>(
      options,
      config_store,
      registry,
      std::make_shared<InMemoryKeyManager>(),
      std::make_shared<ProviderFactory>());
  auto rate_limiter =
      std::make_shared<RateLimiter>(options.default_rate_limit_per_minute());
  auto gateway =
      std::make_shared<InferenceGateway>(rate_limiter, admission, router);

  RegistryRpcService registry_service(registry);
  InferenceHttpService inference_service(gateway);

  brpc::Server server;
  if (server.AddService(&registry_service, brpc::SERVER_DOESNT_OWN_SERVICE) !=
      0) {
    LOG(ERROR) << "Failed to add registry service";
    return -1;
  }
  if (server.AddService(&inference_service,
                        brpc::SERVER_DOESNT_OWN_SERVICE,
                        "/v1/inference => Infer") != 0) {
    LOG(ERROR) << "Failed to add inference service";
    return -1;
  }

  brpc::ServerOptions server_options;
  server_options.num_threads = FLAGS_num_rpc_threads;
  if (server.Start(FLAGS_rpc_port, &server_options) != 0) {
    LOG(ERROR) << "Failed to start server on port " << FLAGS_rpc_port;
    return -1;
  }

  registry->start();
  admission->start();
  scaler->start();
  LOG(INFO) << "Control plane listens on port " << FLAGS_rpc_port;

  server.RunUntilAskedToQuit();

  scaler->stop();
  admission->stop();
  registry->stop();
  admission->sync_spending();
  LOG(INFO) << "Control plane stopped";
  return 0;
}
