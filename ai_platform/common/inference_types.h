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

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ai_platform {

struct TextToImageParams {
  std::string prompt;
  std::string negative_prompt;
  int32_t width = 1024;
  int32_t height = 1024;
  int32_t steps = 50;
  double cfg_scale = 7.5;
  std::optional<int64_t> seed;
  int32_t count = 1;
  std::string model;
};

struct ImageEditParams {
  // base64 payload or URL
  std::string image;
  std::string mask;
  std::string prompt;
  std::string negative_prompt;
  int32_t width = 0;
  int32_t height = 0;
  int32_t steps = 50;
  double cfg_scale = 7.5;
  int32_t count = 1;
};

struct StylizationParams {
  std::string image;
  std::string style;
  double strength = 0.8;
};

struct TextGenerationParams {
  std::string prompt;
  int32_t max_tokens = 1000;
  double temperature = 0.7;
  double top_p = 1.0;
  int32_t top_k = 0;
  std::vector<std::string> stop;
};

// Validated parameters of one inference request, tagged by feature kind.
using InferenceParams = std::variant<TextToImageParams,
                                     ImageEditParams,
                                     StylizationParams,
                                     TextGenerationParams>;

struct TextResult {
  std::string text;
  std::string finish_reason;
  int32_t tokens_input = 0;
  int32_t tokens_output = 0;
};

struct ImageResult {
  std::string url;
  std::string b64_json;
  int32_t width = 0;
  int32_t height = 0;
  std::optional<int64_t> seed;
};

struct ImageResults {
  std::vector<ImageResult> images;
  std::string parameters;
  int32_t tokens_used = 0;
};

}  // namespace ai_platform
