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

#include <gtest/gtest.h>

#include <map>
#include <string>

namespace ai_platform {

namespace {

ProviderConfig make_provider(const std::string& id,
                             ProviderType type,
                             int32_t priority,
                             int32_t weight = 0) {
  ProviderConfig provider;
  provider.id = id;
  provider.feature_id = "text_to_image";
  provider.type = type;
  provider.priority = priority;
  provider.weight = weight;
  return provider;
}

Feature make_feature(RoutingPolicy policy) {
  Feature feature;
  feature.id = "text_to_image";
  RoutingStrategy routing;
  routing.policy = policy;
  feature.routing = routing;
  return feature;
}

}  // namespace

TEST(ProviderSelectorTest, EmptyCandidatesSelectNothing) {
  ProviderSelector selector;
  std::vector<ProviderConfig> none;
  EXPECT_EQ(selector.select(make_feature(RoutingPolicy::PRIORITY), none),
            nullptr);
  EXPECT_EQ(selector.select(make_feature(RoutingPolicy::WEIGHTED), none),
            nullptr);
  EXPECT_EQ(selector.select(make_feature(RoutingPolicy::COST_BASED), none),
            nullptr);
}

TEST(ProviderSelectorTest, PriorityPicksLowestValue) {
  ProviderSelector selector;
  std::vector<ProviderConfig> candidates = {
      make_provider("openai", ProviderType::THIRD_PARTY, 2),
      make_provider("self_hosted", ProviderType::SELF_HOSTED, 1),
      make_provider("stability", ProviderType::THIRD_PARTY, 3),
  };
  // a feature without routing uses the priority policy
  Feature feature;
  for (int i = 0; i < 20; ++i) {
    EXPECT_EQ(selector.select(feature, candidates)->id, "self_hosted");
  }
}

TEST(ProviderSelectorTest, PriorityTiesAreSpreadUniformly) {
  ProviderSelector selector;
  std::vector<ProviderConfig> candidates = {
      make_provider("a", ProviderType::THIRD_PARTY, 1),
      make_provider("b", ProviderType::THIRD_PARTY, 1),
      make_provider("c", ProviderType::THIRD_PARTY, 1),
      make_provider("d", ProviderType::THIRD_PARTY, 2),
  };
  std::map<std::string, int> picks;
  for (int i = 0; i < 1000; ++i) {
    ++picks[selector.select_by_priority(candidates)->id];
  }
  EXPECT_GT(picks["a"], 0);
  EXPECT_GT(picks["b"], 0);
  EXPECT_GT(picks["c"], 0);
  EXPECT_EQ(picks.count("d"), 0u);
}

TEST(ProviderSelectorTest, WeightedFollowsTrafficShares) {
  ProviderSelector selector;
  std::vector<ProviderConfig> candidates = {
      make_provider("a", ProviderType::THIRD_PARTY, 0, 10),
      make_provider("b", ProviderType::THIRD_PARTY, 0, 30),
      make_provider("c", ProviderType::THIRD_PARTY, 0, 60),
  };
  constexpr int kTrials = 10000;
  std::map<std::string, int> picks;
  Feature feature = make_feature(RoutingPolicy::WEIGHTED);
  for (int i = 0; i < kTrials; ++i) {
    ++picks[selector.select(feature, candidates)->id];
  }
  EXPECT_NEAR(picks["a"] / static_cast<double>(kTrials), 0.10, 0.03);
  EXPECT_NEAR(picks["b"] / static_cast<double>(kTrials), 0.30, 0.03);
  EXPECT_NEAR(picks["c"] / static_cast<double>(kTrials), 0.60, 0.03);
}

TEST(ProviderSelectorTest, WeightedWithoutWeightsTakesFirst) {
  ProviderSelector selector;
  std::vector<ProviderConfig> candidates = {
      make_provider("a", ProviderType::THIRD_PARTY, 0, 0),
      make_provider("b", ProviderType::THIRD_PARTY, 0, -5),
  };
  EXPECT_EQ(selector.select_by_weight(candidates)->id, "a");
}

TEST(ProviderSelectorTest, CostBasedPrefersSelfHosted) {
  ProviderSelector selector;
  Feature feature = make_feature(RoutingPolicy::COST_BASED);
  CostConfig cost;
  cost.third_party_per_request = {{"openai", 0.04}, {"stability", 0.02}};
  feature.cost = cost;

  std::vector<ProviderConfig> candidates = {
      make_provider("openai", ProviderType::THIRD_PARTY, 1),
      make_provider("self_hosted", ProviderType::SELF_HOSTED, 5),
      make_provider("stability", ProviderType::THIRD_PARTY, 2),
  };
  EXPECT_EQ(selector.select(feature, candidates)->id, "self_hosted");

  candidates.erase(candidates.begin() + 1);
  EXPECT_EQ(selector.select(feature, candidates)->id, "stability");
}

TEST(ProviderSelectorTest, CostBasedWithoutCostDataTakesFirst) {
  ProviderSelector selector;
  Feature feature = make_feature(RoutingPolicy::COST_BASED);
  std::vector<ProviderConfig> candidates = {
      make_provider("openai", ProviderType::THIRD_PARTY, 1),
      make_provider("stability", ProviderType::THIRD_PARTY, 2),
  };
  EXPECT_EQ(selector.select(feature, candidates)->id, "openai");
}

}  // namespace ai_platform
