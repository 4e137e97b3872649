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

#include "provider/provider_factory.h"

#include <gtest/gtest.h>

#include "common/errors.h"
#include "testing/fakes.h"

namespace ai_platform {

TEST(ProviderFactoryTest, SelfHostedIsBuiltIn) {
  ProviderFactory factory;
  EXPECT_TRUE(factory.has_vendor(kSelfHostedVendor));
  EXPECT_FALSE(factory.has_vendor("openai"));

  auto unknown = factory.create("openai", ProviderSettings());
  ASSERT_FALSE(unknown.ok());
  EXPECT_EQ(error_kind(unknown.status()), ErrorKind::kNotFound);
}

TEST(ProviderFactoryTest, RegisteredVendorsCreateClients) {
  ProviderFactory factory;
  auto stability = testing::register_fake_vendor(&factory, "stability");
  auto openai = testing::register_fake_vendor(&factory, "openai");
  EXPECT_EQ(factory.vendors(),
            (std::vector<std::string>{"openai", "self_hosted", "stability"}));

  ProviderSettings settings;
  settings.api_key = "sk-1";
  auto client = factory.create("openai", settings);
  ASSERT_TRUE(client.ok()) << client.status();
  ASSERT_TRUE((*client)->generate_text(TextGenerationParams()).ok());
  (*client)->close();

  EXPECT_EQ(openai->calls(), 1);
  EXPECT_EQ(openai->closed(), 1);
  EXPECT_EQ(openai->settings()[0].api_key, "sk-1");
  EXPECT_EQ(stability->calls(), 0);
}

TEST(ProviderFactoryTest, RegisterReplacesVendor) {
  ProviderFactory factory;
  auto first = testing::register_fake_vendor(&factory, "openai");
  auto second = testing::register_fake_vendor(&factory, "openai");

  auto client = factory.create("openai", ProviderSettings());
  ASSERT_TRUE(client.ok());
  ASSERT_TRUE((*client)->generate_image(TextToImageParams()).ok());
  EXPECT_EQ(first->calls(), 0);
  EXPECT_EQ(second->calls(), 1);
}

}  // namespace ai_platform
