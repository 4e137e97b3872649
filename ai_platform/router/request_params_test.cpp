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

#include "router/request_params.h"

#include <gtest/gtest.h>

#include "common/errors.h"

namespace ai_platform {

TEST(RequestParamsTest, ResolvesFeatureKinds) {
  EXPECT_EQ(*resolve_feature_kind("text_to_image"),
            FeatureKind::TEXT_TO_IMAGE);
  EXPECT_EQ(*resolve_feature_kind("image_generation"),
            FeatureKind::TEXT_TO_IMAGE);
  EXPECT_EQ(*resolve_feature_kind("text_generation"),
            FeatureKind::TEXT_GENERATION);
  EXPECT_EQ(error_kind(resolve_feature_kind("video").status()),
            ErrorKind::kInvalidArgument);
}

TEST(RequestParamsTest, TextToImageDefaults) {
  auto params = parse_inference_params(
      "text_to_image", nlohmann::json{{"prompt", "a red fox"}, {"extra", 1}});
  ASSERT_TRUE(params.ok()) << params.status();
  ASSERT_EQ(kind_of(*params), FeatureKind::TEXT_TO_IMAGE);

  const auto& t2i = std::get<TextToImageParams>(*params);
  EXPECT_EQ(t2i.prompt, "a red fox");
  EXPECT_EQ(t2i.width, 1024);
  EXPECT_EQ(t2i.height, 1024);
  EXPECT_EQ(t2i.steps, 50);
  EXPECT_DOUBLE_EQ(t2i.cfg_scale, 7.5);
  EXPECT_EQ(t2i.count, 1);
  EXPECT_FALSE(t2i.seed.has_value());
}

TEST(RequestParamsTest, TextToImageOverrides) {
  nlohmann::json body = {{"prompt", "city"},
                         {"width", 512},
                         {"height", 768},
                         {"seed", 42},
                         {"count", 4}};
  auto params = parse_inference_params(FeatureKind::TEXT_TO_IMAGE, body);
  ASSERT_TRUE(params.ok()) << params.status();
  const auto& t2i = std::get<TextToImageParams>(*params);
  EXPECT_EQ(t2i.width, 512);
  EXPECT_EQ(t2i.height, 768);
  EXPECT_EQ(t2i.seed.value_or(0), 42);
  EXPECT_EQ(t2i.count, 4);
}

TEST(RequestParamsTest, RejectsInvalidValues) {
  auto kind = FeatureKind::TEXT_TO_IMAGE;
  EXPECT_FALSE(parse_inference_params(kind, nlohmann::json::array()).ok());
  EXPECT_FALSE(parse_inference_params(kind, nlohmann::json::object()).ok());
  EXPECT_FALSE(parse_inference_params(kind, {{"prompt", ""}}).ok());
  EXPECT_FALSE(parse_inference_params(kind, {{"prompt", 7}}).ok());
  EXPECT_FALSE(
      parse_inference_params(kind, {{"prompt", "x"}, {"width", 8}}).ok());
  EXPECT_FALSE(
      parse_inference_params(kind, {{"prompt", "x"}, {"count", 11}}).ok());
  EXPECT_FALSE(
      parse_inference_params(kind, {{"prompt", "x"}, {"seed", 1.5}}).ok());

  auto status =
      parse_inference_params(kind, {{"prompt", "x"}, {"steps", "many"}})
          .status();
  EXPECT_EQ(error_kind(status), ErrorKind::kInvalidArgument);
  EXPECT_EQ(status.message(), "steps must be a number");
}

TEST(RequestParamsTest, ImageEditingNeedsImageAndPrompt) {
  auto kind = FeatureKind::IMAGE_EDITING;
  EXPECT_FALSE(parse_inference_params(kind, {{"prompt", "sky"}}).ok());

  auto params = parse_inference_params(
      kind, {{"image", "https://images.test/in.png"}, {"prompt", "sky"}});
  ASSERT_TRUE(params.ok()) << params.status();
  const auto& edit = std::get<ImageEditParams>(*params);
  EXPECT_EQ(edit.image, "https://images.test/in.png");
  EXPECT_TRUE(edit.mask.empty());
}

TEST(RequestParamsTest, StylizationStrengthIsBounded) {
  auto kind = FeatureKind::IMAGE_STYLIZATION;
  nlohmann::json body = {{"image", "abc"}, {"style", "ink"}};
  auto params = parse_inference_params(kind, body);
  ASSERT_TRUE(params.ok());
  EXPECT_DOUBLE_EQ(std::get<StylizationParams>(*params).strength, 0.8);

  body["strength"] = 1.5;
  EXPECT_FALSE(parse_inference_params(kind, body).ok());
}

TEST(RequestParamsTest, TextGenerationStopSequences) {
  auto kind = FeatureKind::TEXT_GENERATION;
  auto single = parse_inference_params(kind, {{"prompt", "hi"}, {"stop", "."}});
  ASSERT_TRUE(single.ok());
  EXPECT_EQ(std::get<TextGenerationParams>(*single).stop.size(), 1u);

  nlohmann::json many = {{"prompt", "hi"},
                         {"stop", {"\n", "END"}},
                         {"max_tokens", 64}};
  auto params = parse_inference_params(kind, many);
  ASSERT_TRUE(params.ok());
  const auto& text = std::get<TextGenerationParams>(*params);
  EXPECT_EQ(text.stop.size(), 2u);
  EXPECT_EQ(text.max_tokens, 64);
  EXPECT_DOUBLE_EQ(text.temperature, 0.7);

  EXPECT_FALSE(
      parse_inference_params(kind, {{"prompt", "hi"}, {"stop", 3}}).ok());
}

}  // namespace ai_platform
