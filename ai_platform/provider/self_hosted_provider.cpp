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

#include "provider/self_hosted_provider.h"

#include <absl/strings/str_cat.h>
#include <brpc/controller.h>
#include <glog/logging.h>

#include "common/errors.h"

namespace ai_platform {

namespace {

bool is_retryable_http_status(int status_code) {
  // 0 means the request never got an HTTP answer
  return status_code == 0 || status_code == 429 || status_code >= 500;
}

}  // namespace

absl::StatusOr<std::unique_ptr<Provider>> SelfHostedProvider::create(
    const ProviderSettings& settings) {
  if (settings.endpoint.empty()) {
    return invalid_argument_error("self hosted provider needs an endpoint");
  }

  if (settings.channel != nullptr) {
    return std::unique_ptr<Provider>(
        new SelfHostedProvider(settings, settings.channel));
  }

  auto channel = std::make_shared<brpc::Channel>();
  brpc::ChannelOptions options;
  options.protocol = "http";
  options.timeout_ms = settings.timeout_ms;
  options.max_retry = settings.max_retries;
  if (channel->Init(settings.endpoint.c_str(), "", &options) != 0) {
    LOG(ERROR) << "Fail to initialize channel for " << settings.endpoint;
    return unavailable_error(
        absl::StrCat("cannot reach self hosted instance ", settings.endpoint));
  }
  return std::unique_ptr<Provider>(
      new SelfHostedProvider(settings, std::move(channel)));
}

SelfHostedProvider::SelfHostedProvider(ProviderSettings settings,
                                       std::shared_ptr<brpc::Channel> channel)
    : settings_(std::move(settings)), channel_(std::move(channel)) {}

ProviderCapabilities SelfHostedProvider::capabilities() const {
  ProviderCapabilities caps;
  caps.text_generation = true;
  caps.image_generation = true;
  caps.image_editing = true;
  caps.image_stylization = true;
  if (!settings_.model.empty()) {
    caps.supported_models.emplace_back(settings_.model);
  }
  return caps;
}

absl::StatusOr<TextResult> SelfHostedProvider::generate_text(
    const TextGenerationParams& params) {
  nlohmann::json body;
  body["prompt"] = params.prompt;
  body["max_tokens"] = params.max_tokens;
  body["temperature"] = params.temperature;
  body["top_p"] = params.top_p;
  if (params.top_k > 0) {
    body["top_k"] = params.top_k;
  }
  if (!params.stop.empty()) {
    body["stop"] = params.stop;
  }
  if (!settings_.model.empty()) {
    body["model"] = settings_.model;
  }

  auto response = send_http_request("/v1/text_generation", body);
  if (!response.ok()) {
    return response.status();
  }
  return parse_text_result(*response);
}

absl::StatusOr<ImageResults> SelfHostedProvider::generate_image(
    const TextToImageParams& params) {
  nlohmann::json body;
  body["prompt"] = params.prompt;
  if (!params.negative_prompt.empty()) {
    body["negative_prompt"] = params.negative_prompt;
  }
  body["width"] = params.width;
  body["height"] = params.height;
  body["steps"] = params.steps;
  body["cfg_scale"] = params.cfg_scale;
  body["count"] = params.count;
  if (params.seed.has_value()) {
    body["seed"] = *params.seed;
  }
  if (!params.model.empty()) {
    body["model"] = params.model;
  } else if (!settings_.model.empty()) {
    body["model"] = settings_.model;
  }

  auto response = send_http_request("/v1/text_to_image", body);
  if (!response.ok()) {
    return response.status();
  }
  return parse_image_results(*response);
}

absl::StatusOr<ImageResults> SelfHostedProvider::edit_image(
    const ImageEditParams& params) {
  nlohmann::json body;
  body["image"] = params.image;
  if (!params.mask.empty()) {
    body["mask"] = params.mask;
  }
  body["prompt"] = params.prompt;
  if (!params.negative_prompt.empty()) {
    body["negative_prompt"] = params.negative_prompt;
  }
  if (params.width > 0 && params.height > 0) {
    body["width"] = params.width;
    body["height"] = params.height;
  }
  body["steps"] = params.steps;
  body["cfg_scale"] = params.cfg_scale;
  body["count"] = params.count;

  auto response = send_http_request("/v1/image_editing", body);
  if (!response.ok()) {
    return response.status();
  }
  return parse_image_results(*response);
}

absl::StatusOr<ImageResults> SelfHostedProvider::stylize_image(
    const StylizationParams& params) {
  nlohmann::json body;
  body["image"] = params.image;
  body["style"] = params.style;
  body["strength"] = params.strength;

  auto response = send_http_request("/v1/image_stylization", body);
  if (!response.ok()) {
    return response.status();
  }
  return parse_image_results(*response);
}

absl::Status SelfHostedProvider::health_check() {
  brpc::Controller cntl;
  cntl.http_request().uri() = "/health";
  cntl.http_request().set_method(brpc::HTTP_METHOD_GET);

  channel_->CallMethod(nullptr, &cntl, nullptr, nullptr, nullptr);

  if (cntl.Failed()) {
    LOG(WARNING) << "Health check of " << settings_.endpoint
                 << " failed: " << cntl.ErrorText();
    return provider_error(
        absl::StrCat("health check failed: ", cntl.ErrorText()),
        /*retryable=*/true);
  }
  return absl::OkStatus();
}

absl::StatusOr<nlohmann::json> SelfHostedProvider::send_http_request(
    const std::string& uri,
    const nlohmann::json& request_body) {
  brpc::Controller cntl;
  cntl.http_request().uri() = uri;  // channel already has host:port
  cntl.http_request().set_method(brpc::HTTP_METHOD_POST);
  cntl.http_request().set_content_type("application/json");
  cntl.request_attachment().append(request_body.dump());

  channel_->CallMethod(nullptr, &cntl, nullptr, nullptr, nullptr);

  if (cntl.Failed()) {
    const int status_code = cntl.http_response().status_code();
    LOG(ERROR) << "HTTP request " << uri << " to " << settings_.endpoint
               << " failed: " << cntl.ErrorText();
    return provider_error(
        absl::StrCat("self hosted instance ", settings_.endpoint,
                     " failed: ", cntl.ErrorText()),
        is_retryable_http_status(status_code));
  }

  auto response =
      nlohmann::json::parse(cntl.response_attachment().to_string(),
                            nullptr,
                            /*allow_exceptions=*/false);
  if (response.is_discarded()) {
    return provider_error(
        absl::StrCat("malformed response from ", settings_.endpoint),
        /*retryable=*/false);
  }
  return response;
}

absl::StatusOr<TextResult> parse_text_result(const nlohmann::json& body) {
  if (!body.is_object() || !body.contains("text") ||
      !body["text"].is_string()) {
    return provider_error("response carries no text", /*retryable=*/false);
  }
  TextResult result;
  try {
    result.text = body["text"].get<std::string>();
    result.finish_reason = body.value("finish_reason", "");
    result.tokens_input = body.value("tokens_input", 0);
    result.tokens_output = body.value("tokens_output", 0);
  } catch (const nlohmann::json::type_error& e) {
    return provider_error(absl::StrCat("malformed text result: ", e.what()),
                          /*retryable=*/false);
  }
  return result;
}

absl::StatusOr<ImageResults> parse_image_results(const nlohmann::json& body) {
  if (!body.is_object() || !body.contains("images") ||
      !body["images"].is_array()) {
    return provider_error("response carries no images", /*retryable=*/false);
  }
  ImageResults results;
  try {
    for (const auto& item : body["images"]) {
      if (!item.is_object()) {
        return provider_error("image entry must be an object",
                              /*retryable=*/false);
      }
      ImageResult image;
      image.url = item.value("url", "");
      image.b64_json = item.value("b64_json", "");
      image.width = item.value("width", 0);
      image.height = item.value("height", 0);
      if (item.contains("seed") && item["seed"].is_number_integer()) {
        image.seed = item["seed"].get<int64_t>();
      }
      results.images.emplace_back(std::move(image));
    }
    results.parameters = body.value("parameters", "");
    results.tokens_used = body.value("tokens_used", 0);
  } catch (const nlohmann::json::type_error& e) {
    return provider_error(absl::StrCat("malformed image result: ", e.what()),
                          /*retryable=*/false);
  }
  return results;
}

}  // namespace ai_platform
