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

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "common/inference_types.h"

namespace brpc {
class Channel;
}  // namespace brpc

namespace ai_platform {

struct ProviderCapabilities {
  bool text_generation = false;
  bool image_generation = false;
  bool image_editing = false;
  bool image_stylization = false;
  std::vector<std::string> supported_models;
  int32_t max_batch_size = 0;
};

// Everything a vendor client needs to reach its backend.
struct ProviderSettings {
  std::string api_key;
  // "host:port" for self hosted instances, base URL for vendors
  std::string endpoint;
  std::string model;
  int32_t timeout_ms = 60000;
  int32_t max_retries = 0;
  // self hosted only: cached channel of the instance, a new one is
  // initialized when null
  std::shared_ptr<brpc::Channel> channel;
};

// Capability set of one backend. Vendors advertise what they support through
// capabilities(); calls outside that set return kUnimplemented. Failures of
// the backend itself are reported with provider_error().
class Provider {
 public:
  virtual ~Provider() = default;

  virtual ProviderCapabilities capabilities() const = 0;

  virtual absl::StatusOr<TextResult> generate_text(
      const TextGenerationParams& params) = 0;

  virtual absl::StatusOr<ImageResults> generate_image(
      const TextToImageParams& params) = 0;

  virtual absl::StatusOr<ImageResults> edit_image(
      const ImageEditParams& params) = 0;

  virtual absl::StatusOr<ImageResults> stylize_image(
      const StylizationParams& params) = 0;

  virtual absl::Status health_check() = 0;

  virtual void close() {}
};

}  // namespace ai_platform
