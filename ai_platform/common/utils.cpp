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

#include "common/utils.h"

#include <absl/random/random.h>
#include <absl/strings/escaping.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/time/clock.h>
#include <openssl/err.h>
#include <openssl/rand.h>

#include <mutex>

namespace ai_platform {
namespace utils {

uint64_t fnv1a_hash(absl::string_view data) {
  uint64_t hash = 14695981039346656037ULL;
  for (unsigned char c : data) {
    hash ^= c;
    hash *= 1099511628211ULL;
  }
  return hash;
}

std::string random_hex(size_t length) {
  static constexpr char kHex[] = "0123456789abcdef";
  static std::mutex mutex;
  static absl::BitGen gen;

  std::string out(length, '0');
  std::lock_guard<std::mutex> lock(mutex);
  for (size_t i = 0; i < length; ++i) {
    out[i] = kHex[absl::Uniform<int>(gen, 0, 16)];
  }
  return out;
}

absl::StatusOr<std::string> generate_token() {
  constexpr int kTokenBytes = 16;
  unsigned char bytes[kTokenBytes];
  if (RAND_bytes(bytes, kTokenBytes) != 1) {
    const unsigned long err = ERR_get_error();
    return absl::InternalError(
        absl::StrCat("RAND_bytes failed: ", ERR_error_string(err, nullptr)));
  }
  return absl::BytesToHexString(absl::string_view(
      reinterpret_cast<const char*>(bytes), kTokenBytes));
}

std::string generate_request_id() {
  return absl::StrCat("req-", absl::ToUnixNanos(absl::Now()), "-",
                      random_hex(6));
}

std::string make_service_id(absl::string_view service_type,
                            absl::string_view hostname,
                            absl::string_view ip_address,
                            int32_t port) {
  const uint64_t hash =
      fnv1a_hash(absl::StrCat(hostname, "|", ip_address, "|", port));
  return absl::StrFormat(
      "%s-%08x", service_type, static_cast<uint32_t>(hash & 0xffffffffULL));
}

std::string format_date(absl::Time time) {
  return absl::FormatTime("%Y-%m-%d", time, absl::UTCTimeZone());
}

}  // namespace utils
}  // namespace ai_platform
