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

#include "common/errors.h"

#include <absl/strings/cord.h>
#include <absl/strings/numbers.h>

namespace ai_platform {

namespace {

constexpr absl::string_view kErrorKindUrl = "type.ai-platform/error_kind";
constexpr absl::string_view kRetryableUrl = "type.ai-platform/retryable";

absl::Status make_error(absl::StatusCode code,
                        ErrorKind kind,
                        absl::string_view message) {
  absl::Status status(code, message);
  status.SetPayload(kErrorKindUrl,
                    absl::Cord(std::to_string(static_cast<int32_t>(kind))));
  return status;
}

}  // namespace

const char* error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kOk:
      return "OK";
    case ErrorKind::kNotFound:
      return "NOT_FOUND";
    case ErrorKind::kUnavailable:
      return "UNAVAILABLE";
    case ErrorKind::kUnauthorized:
      return "UNAUTHORIZED";
    case ErrorKind::kBudgetExceeded:
      return "BUDGET_EXCEEDED";
    case ErrorKind::kRateLimited:
      return "RATE_LIMITED";
    case ErrorKind::kProviderError:
      return "PROVIDER_ERROR";
    case ErrorKind::kInvalidArgument:
      return "INVALID_ARGUMENT";
    case ErrorKind::kInternal:
      return "INTERNAL";
  }
  return "INTERNAL";
}

absl::Status not_found_error(absl::string_view message) {
  return make_error(absl::StatusCode::kNotFound, ErrorKind::kNotFound, message);
}

absl::Status unavailable_error(absl::string_view message) {
  return make_error(
      absl::StatusCode::kUnavailable, ErrorKind::kUnavailable, message);
}

absl::Status unauthorized_error(absl::string_view message) {
  return make_error(
      absl::StatusCode::kUnauthenticated, ErrorKind::kUnauthorized, message);
}

absl::Status budget_exceeded_error(absl::string_view message) {
  return make_error(absl::StatusCode::kResourceExhausted,
                    ErrorKind::kBudgetExceeded,
                    message);
}

absl::Status rate_limited_error(absl::string_view message) {
  return make_error(
      absl::StatusCode::kResourceExhausted, ErrorKind::kRateLimited, message);
}

absl::Status invalid_argument_error(absl::string_view message) {
  return make_error(absl::StatusCode::kInvalidArgument,
                    ErrorKind::kInvalidArgument,
                    message);
}

absl::Status provider_error(absl::string_view message, bool retryable) {
  absl::Status status = make_error(
      absl::StatusCode::kInternal, ErrorKind::kProviderError, message);
  status.SetPayload(kRetryableUrl, absl::Cord(retryable ? "1" : "0"));
  return status;
}

ErrorKind error_kind(const absl::Status& status) {
  if (status.ok()) {
    return ErrorKind::kOk;
  }
  auto payload = status.GetPayload(kErrorKindUrl);
  int32_t value = 0;
  if (payload.has_value() &&
      absl::SimpleAtoi(std::string(*payload), &value) &&
      value > 0 && value <= static_cast<int32_t>(ErrorKind::kInternal)) {
    return static_cast<ErrorKind>(value);
  }

  switch (status.code()) {
    case absl::StatusCode::kNotFound:
      return ErrorKind::kNotFound;
    case absl::StatusCode::kUnavailable:
      return ErrorKind::kUnavailable;
    case absl::StatusCode::kUnauthenticated:
    case absl::StatusCode::kPermissionDenied:
      return ErrorKind::kUnauthorized;
    case absl::StatusCode::kResourceExhausted:
      return ErrorKind::kRateLimited;
    case absl::StatusCode::kInvalidArgument:
      return ErrorKind::kInvalidArgument;
    default:
      return ErrorKind::kInternal;
  }
}

bool is_retryable(const absl::Status& status) {
  auto payload = status.GetPayload(kRetryableUrl);
  return payload.has_value() && std::string(*payload) == "1";
}

int http_status_code(const absl::Status& status) {
  switch (error_kind(status)) {
    case ErrorKind::kOk:
      return 200;
    case ErrorKind::kNotFound:
      return 404;
    case ErrorKind::kUnavailable:
      return 503;
    case ErrorKind::kUnauthorized:
      return 401;
    case ErrorKind::kBudgetExceeded:
    case ErrorKind::kRateLimited:
      return 429;
    case ErrorKind::kInvalidArgument:
      return 400;
    case ErrorKind::kProviderError:
    case ErrorKind::kInternal:
      return 500;
  }
  return 500;
}

nlohmann::json error_envelope(const absl::Status& status) {
  nlohmann::json envelope;
  envelope["code"] = error_kind_name(error_kind(status));
  envelope["message"] = std::string(status.message());
  return envelope;
}

}  // namespace ai_platform
