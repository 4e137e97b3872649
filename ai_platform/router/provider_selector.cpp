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

#include "router/provider_selector.h"

#include <algorithm>
#include <limits>

namespace ai_platform {

const ProviderConfig* ProviderSelector::select(
    const Feature& feature,
    const std::vector<ProviderConfig>& candidates) {
  if (!feature.routing.has_value()) {
    return select_by_priority(candidates);
  }
  switch (feature.routing->policy) {
    case RoutingPolicy::WEIGHTED:
      return select_by_weight(candidates);
    case RoutingPolicy::COST_BASED:
      return select_by_cost(feature, candidates);
    case RoutingPolicy::PRIORITY:
    default:
      return select_by_priority(candidates);
  }
}

const ProviderConfig* ProviderSelector::select_by_priority(
    const std::vector<ProviderConfig>& candidates) {
  if (candidates.empty()) {
    return nullptr;
  }

  int32_t min_priority = candidates.front().priority;
  for (const auto& provider : candidates) {
    min_priority = std::min(min_priority, provider.priority);
  }

  std::vector<const ProviderConfig*> top;
  for (const auto& provider : candidates) {
    if (provider.priority == min_priority) {
      top.emplace_back(&provider);
    }
  }
  if (top.size() == 1) {
    return top.front();
  }

  std::lock_guard<std::mutex> lock(gen_mutex_);
  return top[absl::Uniform<size_t>(gen_, 0, top.size())];
}

const ProviderConfig* ProviderSelector::select_by_weight(
    const std::vector<ProviderConfig>& candidates) {
  if (candidates.empty()) {
    return nullptr;
  }

  int64_t total_weight = 0;
  for (const auto& provider : candidates) {
    total_weight += std::max(provider.weight, 0);
  }
  if (total_weight == 0) {
    return &candidates.front();
  }

  int64_t remainder = 0;
  {
    std::lock_guard<std::mutex> lock(gen_mutex_);
    remainder = absl::Uniform<int64_t>(gen_, 0, total_weight);
  }
  for (const auto& provider : candidates) {
    remainder -= std::max(provider.weight, 0);
    if (remainder < 0) {
      return &provider;
    }
  }
  return &candidates.back();
}

const ProviderConfig* ProviderSelector::select_by_cost(
    const Feature& feature,
    const std::vector<ProviderConfig>& candidates) {
  if (candidates.empty()) {
    return nullptr;
  }

  for (const auto& provider : candidates) {
    if (provider.type == ProviderType::SELF_HOSTED) {
      return &provider;
    }
  }
  if (!feature.cost.has_value()) {
    return &candidates.front();
  }

  const auto& costs = feature.cost->third_party_per_request;
  const ProviderConfig* cheapest = nullptr;
  double min_cost = std::numeric_limits<double>::max();
  for (const auto& provider : candidates) {
    auto it = costs.find(provider.id);
    if (it != costs.end() && it->second < min_cost) {
      min_cost = it->second;
      cheapest = &provider;
    }
  }
  return cheapest != nullptr ? cheapest : &candidates.front();
}

}  // namespace ai_platform
