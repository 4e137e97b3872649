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

#include <brpc/channel.h>

#include <memory>
#include <nlohmann/json.hpp>
#include <string>

#include "common/macros.h"
#include "provider/provider.h"

namespace ai_platform {

// JSON over HTTP client of one self-hosted inference instance.
//
//   POST /v1/text_generation    TextGenerationParams -> TextResult
//   POST /v1/text_to_image      TextToImageParams    -> ImageResults
//   POST /v1/image_editing      ImageEditParams      -> ImageResults
//   POST /v1/image_stylization  StylizationParams    -> ImageResults
//   GET  /health
class SelfHostedProvider final : public Provider {
 public:
  // settings.endpoint is the instance "host:port". settings.channel is used
  // as is when set.
  static absl::StatusOr<std::unique_ptr<Provider>> create(
      const ProviderSettings& settings);

  ~SelfHostedProvider() override = default;

  ProviderCapabilities capabilities() const override;

  absl::StatusOr<TextResult> generate_text(
      const TextGenerationParams& params) override;

  absl::StatusOr<ImageResults> generate_image(
      const TextToImageParams& params) override;

  absl::StatusOr<ImageResults> edit_image(
      const ImageEditParams& params) override;

  absl::StatusOr<ImageResults> stylize_image(
      const StylizationParams& params) override;

  absl::Status health_check() override;

 private:
  SelfHostedProvider(ProviderSettings settings,
                     std::shared_ptr<brpc::Channel> channel);

  DISALLOW_COPY_AND_ASSIGN(SelfHostedProvider);

  absl::StatusOr<nlohmann::json> send_http_request(
      const std::string& uri,
      const nlohmann::json& request_body);

  ProviderSettings settings_;
  std::shared_ptr<brpc::Channel> channel_;
};

// Decoding of instance responses, shared with tests.
absl::StatusOr<TextResult> parse_text_result(const nlohmann::json& body);
absl::StatusOr<ImageResults> parse_image_results(const nlohmann::json& body);

}  // namespace ai_platform
