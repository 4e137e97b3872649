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
#include <absl/strings/string_view.h>

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace ai_platform {

// Error taxonomy of the control plane. Each kind rides on a canonical absl
// code and is attached to the status as a payload, so callers can branch on
// the kind even when two kinds share a code.
enum class ErrorKind : int32_t {
  kOk = 0,
  kNotFound = 1,
  kUnavailable = 2,
  kUnauthorized = 3,
  kBudgetExceeded = 4,
  kRateLimited = 5,
  kProviderError = 6,
  kInvalidArgument = 7,
  kInternal = 8,
};

const char* error_kind_name(ErrorKind kind);

absl::Status not_found_error(absl::string_view message);
absl::Status unavailable_error(absl::string_view message);
absl::Status unauthorized_error(absl::string_view message);
absl::Status budget_exceeded_error(absl::string_view message);
absl::Status rate_limited_error(absl::string_view message);
absl::Status invalid_argument_error(absl::string_view message);
absl::Status provider_error(absl::string_view message, bool retryable);

// Falls back to the canonical code when no kind payload is attached.
ErrorKind error_kind(const absl::Status& status);

bool is_retryable(const absl::Status& status);

// HTTP status class used by the gateway boundary.
int http_status_code(const absl::Status& status);

// {"code": "<KIND>", "message": "<message>"}
nlohmann::json error_envelope(const absl::Status& status);

}  // namespace ai_platform
