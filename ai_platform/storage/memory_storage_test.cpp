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

#include <gtest/gtest.h>

#include <fstream>
#include <string>

#include "common/errors.h"

namespace ai_platform {

namespace {

std::string write_file(const std::string& name, const std::string& content) {
  const std::string path = ::testing::TempDir() + name;
  std::ofstream file(path);
  file << content;
  return path;
}

Feature make_feature(const std::string& id, const std::string& category) {
  Feature feature;
  feature.id = id;
  feature.category = category;
  return feature;
}

}  // namespace

TEST(InMemoryConfigStoreTest, LooksUpByIdAndCategory) {
  InMemoryConfigStore store;
  store.put_feature(make_feature("sdxl_text_to_image", "text_to_image"));
  store.put_feature(make_feature("flux_text_to_image", "text_to_image"));
  store.put_feature(make_feature("text_generation", "text_generation"));

  auto feature = store.get_feature("text_generation");
  ASSERT_TRUE(feature.ok());
  EXPECT_EQ(feature->category, "text_generation");

  auto by_category = store.get_features_by_category("text_to_image");
  ASSERT_TRUE(by_category.ok());
  ASSERT_EQ(by_category->size(), 2u);
  EXPECT_EQ((*by_category)[0].id, "sdxl_text_to_image");
  EXPECT_EQ((*by_category)[1].id, "flux_text_to_image");

  auto missing = store.get_feature("speech");
  EXPECT_EQ(error_kind(missing.status()), ErrorKind::kNotFound);
}

TEST(InMemoryConfigStoreTest, PutReplacesSameId) {
  InMemoryConfigStore store;
  store.put_feature(make_feature("text_to_image", "a"));
  store.put_feature(make_feature("text_to_image", "b"));
  EXPECT_EQ(store.size(), 1u);
  EXPECT_EQ(store.get_feature("text_to_image")->category, "b");
}

TEST(InMemoryConfigStoreTest, LoadsFeatureFile) {
  const std::string path = write_file("features.json", R"({
    "features": [
      {"id": "text_to_image", "category": "image_generation",
       "providers": [{"id": "sd-local", "type": "self_hosted"}]},
      {"id": "text_generation"}
    ]
  })");
  InMemoryConfigStore store;
  ASSERT_TRUE(store.load_file(path).ok());
  EXPECT_EQ(store.size(), 2u);
  EXPECT_EQ(store.get_feature("text_to_image")->providers.size(), 1u);
}

TEST(InMemoryConfigStoreTest, LoadFileErrors) {
  InMemoryConfigStore store;
  EXPECT_EQ(error_kind(store.load_file("/nonexistent/features.json")),
            ErrorKind::kNotFound);

  const std::string malformed =
      write_file("malformed.json", "{\"features\": [");
  EXPECT_EQ(error_kind(store.load_file(malformed)),
            ErrorKind::kInvalidArgument);
  EXPECT_EQ(store.size(), 0u);
}

TEST(InMemoryBudgetStoreTest, DailyCostIsAdditive) {
  InMemoryBudgetStore store;
  ASSERT_TRUE(store.upsert_daily_cost("2025-01-01", "global", 1.5).ok());
  ASSERT_TRUE(store.upsert_daily_cost("2025-01-01", "global", 2.0).ok());
  ASSERT_TRUE(store.upsert_daily_cost("2025-01-02", "global", 4.0).ok());
  EXPECT_DOUBLE_EQ(store.daily_cost("2025-01-01", "global"), 3.5);
  EXPECT_DOUBLE_EQ(store.daily_cost("2025-01-02", "global"), 4.0);
  EXPECT_DOUBLE_EQ(store.daily_cost("2025-01-01", "service:x"), 0.0);
}

TEST(InMemoryBudgetStoreTest, CostRecordsAreCapped) {
  InMemoryBudgetStore store(3);
  for (int i = 0; i < 5; ++i) {
    CostRecord record;
    record.request_id = "req-" + std::to_string(i);
    ASSERT_TRUE(store.append_cost_record(record, "self_hosted").ok());
  }
  auto records = store.cost_records();
  ASSERT_EQ(records.size(), 3u);
  EXPECT_EQ(records.front().first.request_id, "req-2");
  EXPECT_EQ(records.back().first.request_id, "req-4");
}

TEST(InMemoryServiceStoreTest, UpsertKeepsOneRowPerInstance) {
  InMemoryServiceStore store;
  ServiceInstance instance;
  instance.id = "text_to_image-0000abcd";
  instance.state = HealthState::HEALTHY;
  ASSERT_TRUE(store.upsert_service(instance).ok());
  instance.state = HealthState::DRAINING;
  ASSERT_TRUE(store.upsert_service(instance).ok());

  auto services = store.load_services();
  ASSERT_TRUE(services.ok());
  ASSERT_EQ(services->size(), 1u);
  EXPECT_EQ(services->front().state, HealthState::DRAINING);
}

}  // namespace ai_platform
