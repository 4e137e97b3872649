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
#include <absl/strings/string_view.h>
#include <absl/time/time.h>

#include <cstdint>
#include <string>

namespace ai_platform {
namespace utils {

// 64-bit FNV-1a, stable across processes and builds.
uint64_t fnv1a_hash(absl::string_view data);

// Random lowercase hex string of `length` characters.
std::string random_hex(size_t length);

// 128 bits from the OpenSSL CSPRNG as 32 lowercase hex characters.
absl::StatusOr<std::string> generate_token();

std::string generate_request_id();

// "<service_type>-<8 hex>" derived from the network identity, so the same
// instance always maps to the same id.
std::string make_service_id(absl::string_view service_type,
                            absl::string_view hostname,
                            absl::string_view ip_address,
                            int32_t port);

// UTC calendar date, "YYYY-MM-DD".
std::string format_date(absl::Time time);

}  // namespace utils
}  // namespace ai_platform
