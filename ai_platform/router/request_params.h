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

#include <absl/status/statusor.h>

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "common/inference_types.h"

namespace ai_platform {

enum class FeatureKind : int8_t {
  TEXT_TO_IMAGE = 0,
  IMAGE_EDITING = 1,
  IMAGE_STYLIZATION = 2,
  TEXT_GENERATION = 3,
};

const char* feature_kind_name(FeatureKind kind);

// Resolves a feature id or category ("text_to_image", "image_generation",
// "image_editing", "image_stylization", "text_generation").
absl::StatusOr<FeatureKind> resolve_feature_kind(const std::string& feature);

FeatureKind kind_of(const InferenceParams& params);

// Validates loosely typed request parameters into the variant of `kind`.
// Unknown keys are ignored; wrong types and out of range values are
// rejected with kInvalidArgument.
absl::StatusOr<InferenceParams> parse_inference_params(
    FeatureKind kind,
    const nlohmann::json& params);

absl::StatusOr<InferenceParams> parse_inference_params(
    const std::string& feature,
    const nlohmann::json& params);

}  // namespace ai_platform
