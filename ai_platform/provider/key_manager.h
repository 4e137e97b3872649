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
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/macros.h"

namespace ai_platform {

// Metadata of a stored vendor credential. The secret itself is only handed
// out by KeyManager::get_plaintext_key().
struct ApiKey {
  std::string id;
  std::string vendor;
  std::string service;
  std::string alias;
  // primary, backup, overflow
  std::string tier;
  bool enabled = true;
};

struct KeyUsageRecord {
  std::string key_id;
  std::string request_id;
  std::string feature;
  int32_t tokens_input = 0;
  int32_t tokens_output = 0;
  int32_t image_count = 0;
  double cost = 0.0;
};

// Vendor credential store. Encryption and rotation live behind it.
class KeyManager {
 public:
  virtual ~KeyManager() = default;

  // NotFound / Unavailable when the vendor has no usable key for `service`.
  virtual absl::StatusOr<ApiKey> get_active_key(const std::string& vendor,
                                                const std::string& service) = 0;

  virtual absl::StatusOr<std::string> get_plaintext_key(const ApiKey& key) = 0;

  virtual absl::Status record_usage(const std::string& key_id,
                                    const KeyUsageRecord& usage) = 0;
};

// Keys held in process, for the standalone server and tests. The active key
// of a (vendor, service) pair is the enabled one of the best tier (primary,
// backup, overflow), ties broken by insertion order.
class InMemoryKeyManager final : public KeyManager {
 public:
  InMemoryKeyManager() = default;
  ~InMemoryKeyManager() override = default;

  // Replaces any key with the same id.
  void add_key(const ApiKey& key, const std::string& secret);

  absl::Status set_enabled(const std::string& key_id, bool enabled);

  absl::StatusOr<ApiKey> get_active_key(const std::string& vendor,
                                        const std::string& service) override;

  absl::StatusOr<std::string> get_plaintext_key(const ApiKey& key) override;

  absl::Status record_usage(const std::string& key_id,
                            const KeyUsageRecord& usage) override;

  std::vector<KeyUsageRecord> usages(const std::string& key_id) const;

 private:
  DISALLOW_COPY_AND_ASSIGN(InMemoryKeyManager);

  mutable std::mutex mutex_;
  std::vector<ApiKey> keys_;
  std::unordered_map<std::string, std::string> secrets_;
  std::unordered_map<std::string, std::vector<KeyUsageRecord>> usages_;
};

}  // namespace ai_platform
