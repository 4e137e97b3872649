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

#include "common/feature_config.h"

#include <gtest/gtest.h>

#include "common/errors.h"

namespace ai_platform {

namespace {

nlohmann::json text_to_image_json() {
  return nlohmann::json::parse(R"({
    "id": "text_to_image",
    "name": "Text to image",
    "category": "image_generation",
    "providers": [
      {"id": "sd-local", "type": "self_hosted", "priority": 1, "weight": 70,
       "image": "registry.local/sdxl:1.0", "min_instances": 0,
       "max_instances": 5},
      {"id": "vendor-a", "type": "third_party", "vendor": "vendor_a",
       "priority": 2, "weight": 30, "model": "image-v2", "enabled": false}
    ],
    "routing": {"strategy": "weighted", "fallback_enabled": true,
                "timeout": 60, "max_retries": 2},
    "cost": {"self_hosted_per_hour": 12.5,
             "third_party_per_request": {"vendor-a": 0.14}}
  })");
}

}  // namespace

TEST(FeatureConfigTest, ParsesFeature) {
  auto feature = parse_feature(text_to_image_json());
  ASSERT_TRUE(feature.ok()) << feature.status();

  EXPECT_EQ(feature->id, "text_to_image");
  EXPECT_EQ(feature->category, "image_generation");
  EXPECT_TRUE(feature->enabled);
  ASSERT_EQ(feature->providers.size(), 2u);

  const ProviderConfig& local = feature->providers[0];
  EXPECT_EQ(local.type, ProviderType::SELF_HOSTED);
  EXPECT_EQ(local.feature_id, "text_to_image");
  EXPECT_EQ(local.weight, 70);
  EXPECT_EQ(local.max_instances, 5);

  const ProviderConfig& vendor = feature->providers[1];
  EXPECT_EQ(vendor.type, ProviderType::THIRD_PARTY);
  EXPECT_EQ(vendor.vendor, "vendor_a");
  EXPECT_FALSE(vendor.enabled);

  ASSERT_TRUE(feature->routing.has_value());
  EXPECT_EQ(feature->routing->policy, RoutingPolicy::WEIGHTED);
  EXPECT_TRUE(feature->routing->fallback_enabled);
  EXPECT_EQ(feature->routing->timeout_s, 60);

  ASSERT_TRUE(feature->cost.has_value());
  EXPECT_DOUBLE_EQ(feature->cost->self_hosted_per_hour, 12.5);
  EXPECT_DOUBLE_EQ(feature->cost->third_party_per_request.at("vendor-a"), 0.14);
}

TEST(FeatureConfigTest, RoutingAndCostAreOptional) {
  auto feature = parse_feature(nlohmann::json{{"id", "text_generation"}});
  ASSERT_TRUE(feature.ok());
  EXPECT_FALSE(feature->routing.has_value());
  EXPECT_FALSE(feature->cost.has_value());
  EXPECT_TRUE(feature->providers.empty());
}

TEST(FeatureConfigTest, UnknownPolicyFallsBackToPriority) {
  EXPECT_EQ(parse_routing_policy("round_robin"), RoutingPolicy::PRIORITY);
  EXPECT_EQ(parse_routing_policy("cost_based"), RoutingPolicy::COST_BASED);
  EXPECT_STREQ(routing_policy_name(RoutingPolicy::WEIGHTED), "weighted");
}

TEST(FeatureConfigTest, RejectsInvalidFeature) {
  EXPECT_EQ(error_kind(parse_feature(nlohmann::json::array()).status()),
            ErrorKind::kInvalidArgument);
  EXPECT_EQ(error_kind(parse_feature(nlohmann::json{{"name", "x"}}).status()),
            ErrorKind::kInvalidArgument);

  nlohmann::json bad_type = text_to_image_json();
  bad_type["providers"][0]["type"] = "edge";
  EXPECT_FALSE(parse_feature(bad_type).ok());

  nlohmann::json no_vendor = text_to_image_json();
  no_vendor["providers"][1].erase("vendor");
  EXPECT_FALSE(parse_feature(no_vendor).ok());

  nlohmann::json wrong_field_type = text_to_image_json();
  wrong_field_type["providers"][0]["priority"] = "high";
  auto status = parse_feature(wrong_field_type).status();
  EXPECT_EQ(error_kind(status), ErrorKind::kInvalidArgument);
}

TEST(FeatureConfigTest, ParsesFeatureList) {
  nlohmann::json wrapped;
  wrapped["features"] = nlohmann::json::array(
      {text_to_image_json(), nlohmann::json{{"id", "text_generation"}}});
  auto features = parse_features(wrapped);
  ASSERT_TRUE(features.ok());
  ASSERT_EQ(features->size(), 2u);
  EXPECT_EQ((*features)[1].id, "text_generation");

  auto bare = parse_features(wrapped["features"]);
  ASSERT_TRUE(bare.ok());
  EXPECT_EQ(bare->size(), 2u);

  EXPECT_FALSE(parse_features(nlohmann::json{{"items", 1}}).ok());
}

}  // namespace ai_platform
