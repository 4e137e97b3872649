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

#include <absl/strings/str_cat.h>

#include <unordered_map>

#include "common/errors.h"

namespace ai_platform {

namespace {

constexpr int32_t kMinImageSide = 64;
constexpr int32_t kMaxImageSide = 4096;
constexpr int32_t kMaxImageCount = 10;

// Readers leave `out` untouched when the key is absent.
absl::Status read_string(const nlohmann::json& params,
                         const char* key,
                         bool required,
                         std::string* out) {
  auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    if (required) {
      return invalid_argument_error(absl::StrCat(key, " is required"));
    }
    return absl::OkStatus();
  }
  if (!it->is_string()) {
    return invalid_argument_error(absl::StrCat(key, " must be a string"));
  }
  *out = it->get<std::string>();
  if (required && out->empty()) {
    return invalid_argument_error(absl::StrCat(key, " must not be empty"));
  }
  return absl::OkStatus();
}

absl::Status read_int(const nlohmann::json& params,
                      const char* key,
                      int32_t min_value,
                      int32_t max_value,
                      int32_t* out) {
  auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return absl::OkStatus();
  }
  if (!it->is_number()) {
    return invalid_argument_error(absl::StrCat(key, " must be a number"));
  }
  const double value = it->get<double>();
  if (value < min_value || value > max_value) {
    return invalid_argument_error(absl::StrCat(
        key, " must be within [", min_value, ", ", max_value, "]"));
  }
  *out = static_cast<int32_t>(value);
  return absl::OkStatus();
}

absl::Status read_double(const nlohmann::json& params,
                         const char* key,
                         double min_value,
                         double max_value,
                         double* out) {
  auto it = params.find(key);
  if (it == params.end() || it->is_null()) {
    return absl::OkStatus();
  }
  if (!it->is_number()) {
    return invalid_argument_error(absl::StrCat(key, " must be a number"));
  }
  const double value = it->get<double>();
  if (value < min_value || value > max_value) {
    return invalid_argument_error(absl::StrCat(
        key, " must be within [", min_value, ", ", max_value, "]"));
  }
  *out = value;
  return absl::OkStatus();
}

absl::StatusOr<InferenceParams> parse_text_to_image(
    const nlohmann::json& params) {
  TextToImageParams out;
  absl::Status status = read_string(params, "prompt", true, &out.prompt);
  if (status.ok()) {
    status =
        read_string(params, "negative_prompt", false, &out.negative_prompt);
  }
  if (status.ok()) {
    status =
        read_int(params, "width", kMinImageSide, kMaxImageSide, &out.width);
  }
  if (status.ok()) {
    status =
        read_int(params, "height", kMinImageSide, kMaxImageSide, &out.height);
  }
  if (status.ok()) {
    status = read_int(params, "steps", 1, 500, &out.steps);
  }
  if (status.ok()) {
    status = read_double(params, "cfg_scale", 0.0, 50.0, &out.cfg_scale);
  }
  if (status.ok()) {
    status = read_int(params, "count", 1, kMaxImageCount, &out.count);
  }
  if (status.ok()) {
    status = read_string(params, "model", false, &out.model);
  }
  if (!status.ok()) {
    return status;
  }

  auto seed = params.find("seed");
  if (seed != params.end() && !seed->is_null()) {
    if (!seed->is_number_integer()) {
      return invalid_argument_error("seed must be an integer");
    }
    out.seed = seed->get<int64_t>();
  }
  return InferenceParams(std::move(out));
}

absl::StatusOr<InferenceParams> parse_image_edit(
    const nlohmann::json& params) {
  ImageEditParams out;
  absl::Status status = read_string(params, "image", true, &out.image);
  if (status.ok()) {
    status = read_string(params, "prompt", true, &out.prompt);
  }
  if (status.ok()) {
    status = read_string(params, "mask", false, &out.mask);
  }
  if (status.ok()) {
    status =
        read_string(params, "negative_prompt", false, &out.negative_prompt);
  }
  if (status.ok()) {
    status = read_int(params, "width", 0, kMaxImageSide, &out.width);
  }
  if (status.ok()) {
    status = read_int(params, "height", 0, kMaxImageSide, &out.height);
  }
  if (status.ok()) {
    status = read_int(params, "steps", 1, 500, &out.steps);
  }
  if (status.ok()) {
    status = read_double(params, "cfg_scale", 0.0, 50.0, &out.cfg_scale);
  }
  if (status.ok()) {
    status = read_int(params, "count", 1, kMaxImageCount, &out.count);
  }
  if (!status.ok()) {
    return status;
  }
  return InferenceParams(std::move(out));
}

absl::StatusOr<InferenceParams> parse_stylization(
    const nlohmann::json& params) {
  StylizationParams out;
  absl::Status status = read_string(params, "image", true, &out.image);
  if (status.ok()) {
    status = read_string(params, "style", true, &out.style);
  }
  if (status.ok()) {
    status = read_double(params, "strength", 0.0, 1.0, &out.strength);
  }
  if (!status.ok()) {
    return status;
  }
  return InferenceParams(std::move(out));
}

absl::StatusOr<InferenceParams> parse_text_generation(
    const nlohmann::json& params) {
  TextGenerationParams out;
  absl::Status status = read_string(params, "prompt", true, &out.prompt);
  if (status.ok()) {
    status = read_int(params, "max_tokens", 1, 1 << 20, &out.max_tokens);
  }
  if (status.ok()) {
    status = read_double(params, "temperature", 0.0, 2.0, &out.temperature);
  }
  if (status.ok()) {
    status = read_double(params, "top_p", 0.0, 1.0, &out.top_p);
  }
  if (status.ok()) {
    status = read_int(params, "top_k", 0, 1 << 16, &out.top_k);
  }
  if (!status.ok()) {
    return status;
  }

  auto stop = params.find("stop");
  if (stop != params.end() && !stop->is_null()) {
    if (stop->is_string()) {
      out.stop.emplace_back(stop->get<std::string>());
    } else if (stop->is_array()) {
      for (const auto& item : *stop) {
        if (!item.is_string()) {
          return invalid_argument_error("stop must hold strings");
        }
        out.stop.emplace_back(item.get<std::string>());
      }
    } else {
      return invalid_argument_error("stop must be a string or an array");
    }
  }
  return InferenceParams(std::move(out));
}

}  // namespace

const char* feature_kind_name(FeatureKind kind) {
  switch (kind) {
    case FeatureKind::TEXT_TO_IMAGE:
      return "text_to_image";
    case FeatureKind::IMAGE_EDITING:
      return "image_editing";
    case FeatureKind::IMAGE_STYLIZATION:
      return "image_stylization";
    case FeatureKind::TEXT_GENERATION:
      return "text_generation";
  }
  return "unknown";
}

absl::StatusOr<FeatureKind> resolve_feature_kind(const std::string& feature) {
  static const std::unordered_map<std::string, FeatureKind> kKinds = {
      {"text_to_image", FeatureKind::TEXT_TO_IMAGE},
      {"image_generation", FeatureKind::TEXT_TO_IMAGE},
      {"image_editing", FeatureKind::IMAGE_EDITING},
      {"image_stylization", FeatureKind::IMAGE_STYLIZATION},
      {"text_generation", FeatureKind::TEXT_GENERATION},
  };
  auto it = kKinds.find(feature);
  if (it == kKinds.end()) {
    return invalid_argument_error(
        absl::StrCat("unsupported feature: ", feature));
  }
  return it->second;
}

FeatureKind kind_of(const InferenceParams& params) {
  switch (params.index()) {
    case 0:
      return FeatureKind::TEXT_TO_IMAGE;
    case 1:
      return FeatureKind::IMAGE_EDITING;
    case 2:
      return FeatureKind::IMAGE_STYLIZATION;
    default:
      return FeatureKind::TEXT_GENERATION;
  }
}

absl::StatusOr<InferenceParams> parse_inference_params(
    FeatureKind kind,
    const nlohmann::json& params) {
  if (!params.is_object()) {
    return invalid_argument_error("params must be an object");
  }
  switch (kind) {
    case FeatureKind::TEXT_TO_IMAGE:
      return parse_text_to_image(params);
    case FeatureKind::IMAGE_EDITING:
      return parse_image_edit(params);
    case FeatureKind::IMAGE_STYLIZATION:
      return parse_stylization(params);
    case FeatureKind::TEXT_GENERATION:
      return parse_text_generation(params);
  }
  return invalid_argument_error("unsupported feature kind");
}

absl::StatusOr<InferenceParams> parse_inference_params(
    const std::string& feature,
    const nlohmann::json& params) {
  auto kind = resolve_feature_kind(feature);
  if (!kind.ok()) {
    return kind.status();
  }
  return parse_inference_params(*kind, params);
}

}  // namespace ai_platform
